//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Lesser General Public License for more details.
// 
// You should have received a copy of the GNU Lesser General Public License
// along with this program.  If not, see http://www.gnu.org/licenses/.
// 

#include "Frame.h"

#include <algorithm>
#include <cctype>

#include "../common/Constants.h"
#include "../common/Exceptions.h"
#include "../common/Util.h"

namespace dsfusion {

Frame::Frame() {
}

Frame::Frame(const std::vector<std::string>& labels) :
        _elements(labels) {
    for (const auto& label : _elements) {
        if (label.empty()) {
            throw ValidationError("Frame labels must not be empty");
        }
        if (!isValidLabel(label)) {
            throw ValidationError("Invalid frame label '" + label
                    + "': only letters, digits and '_' are allowed");
        }
    }
    std::sort(_elements.begin(), _elements.end());
    _elements.erase(std::unique(_elements.begin(), _elements.end()),
            _elements.end());
    if (_elements.size() > constants::MAX_FRAME_SIZE) {
        throw ValidationError(
                "Frame has " + std::to_string(_elements.size())
                        + " elements, at most "
                        + std::to_string(constants::MAX_FRAME_SIZE)
                        + " are supported");
    }
}

bool Frame::isValidLabel(const std::string& label) {
    if (label.empty()) {
        return false;
    }
    for (char c : label) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

bool Frame::contains(const std::string& label) const {
    return std::binary_search(_elements.begin(), _elements.end(), label);
}

std::size_t Frame::indexOf(const std::string& label) const {
    auto it = std::lower_bound(_elements.begin(), _elements.end(), label);
    if (it == _elements.end() || *it != label) {
        throw ValidationError(
                "Element '" + label + "' is not in the frame " + format(universe()));
    }
    return it - _elements.begin();
}

Subset Frame::universe() const {
    if (_elements.size() == constants::MAX_FRAME_SIZE) {
        return Subset(~Subset::mask_type(0));
    }
    return Subset((Subset::mask_type(1) << _elements.size()) - 1);
}

Subset Frame::subset(const std::vector<std::string>& labels) const {
    Subset result;
    for (const auto& label : labels) {
        result = result | Subset::singleton(indexOf(label));
    }
    return result;
}

std::vector<std::string> Frame::labels(const Subset& subset) const {
    std::vector<std::string> result;
    for (std::size_t i = 0; i < _elements.size(); i++) {
        if (subset.contains(i)) {
            result.push_back(_elements[i]);
        }
    }
    return result;
}

std::string Frame::format(const Subset& subset) const {
    return "{" + util::join(labels(subset), ",") + "}";
}

std::vector<std::string> Frame::parseLabels(const std::string& text) {
    std::string s = util::trim(text);
    if (s.size() < 2 || s.front() != '{' || s.back() != '}') {
        throw ValidationError("Malformed subset string: '" + text + "'");
    }
    std::string body = util::trim(s.substr(1, s.size() - 2));
    std::vector<std::string> result;
    if (body.empty()) {
        return result;
    }
    for (const auto& token : util::split(body, ',')) {
        std::string label = util::trim(token);
        if (label.empty()) {
            throw ValidationError("Malformed subset string: '" + text + "'");
        }
        result.push_back(label);
    }
    return result;
}

Subset Frame::parse(const std::string& text) const {
    return subset(parseLabels(text));
}

Subset Frame::translate(const Subset& subset, const Frame& from) const {
    if (&from == this || from == *this) {
        return subset;
    }
    return this->subset(from.labels(subset));
}

Powerset Frame::powerset() const {
    // 2^n must fit a mask and stay enumerable
    if (_elements.size() >= constants::MAX_FRAME_SIZE / 2) {
        throw ValidationError(
                "Cannot enumerate the powerset of a frame with "
                        + std::to_string(_elements.size()) + " elements");
    }
    return Powerset(_elements.size());
}

Frame Frame::unite(const Frame& other) const {
    std::vector<std::string> merged(_elements);
    merged.insert(merged.end(), other._elements.begin(), other._elements.end());
    return Frame(merged);
}

bool Frame::isSubframeOf(const Frame& other) const {
    return std::includes(other._elements.begin(), other._elements.end(),
            _elements.begin(), _elements.end());
}

std::ostream& operator<<(std::ostream& os, const Frame& frame) {
    os << "Frame" << frame.format(frame.universe());
    return os;
}

}
