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

#include "MassFunction.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

#include "../common/Constants.h"
#include "../common/Exceptions.h"

namespace dsfusion {

namespace {

void validateMass(double value, const std::string& key) {
    if (std::isnan(value) || std::isinf(value)) {
        throw ValidationError("Mass for " + key + " is not finite");
    }
    if (value < 0.0) {
        std::ostringstream oss;
        oss << "Mass for " << key << " is negative (" << value << ")";
        throw ValidationError(oss.str());
    }
}

}

MassFunction::MassFunction(const Frame& frame, const MassMap& masses,
        bool explicitFrame) :
        _frame(frame), _masses(masses), _explicitFrame(explicitFrame) {
}

MassFunction MassFunction::fromRaw(const Frame& frame, const MassMap& masses,
        bool explicitFrame) {
    Subset omega = frame.universe();
    MassMap kept;
    for (const auto& [focal, value] : masses) {
        if (!focal.isSubsetOf(omega)) {
            throw ValidationError("Focal set is not a subset of the frame");
        }
        validateMass(value, frame.format(focal));
        if (value > constants::PRUNE_EPSILON) {
            kept[focal] = value;
        }
    }
    return MassFunction(frame, kept, explicitFrame);
}

MassFunction MassFunction::create(const Frame& frame, const MassMap& masses,
        bool explicitFrame) {
    MassFunction m = fromRaw(frame, masses, explicitFrame);
    if (m._masses.empty()) {
        throw ValidationError("A mass function needs at least one positive mass");
    }
    // a validated mass function never keeps conflict, even when the total is 1
    if (!m.isNormalized() || m.conflictMass() > 0.0) {
        return m.normalize();
    }
    return m;
}

MassFunction::MassMap MassFunction::fromLabels(const Frame& frame,
        const LabelMasses& masses) {
    MassMap merged;
    for (const auto& [labels, value] : masses) {
        Subset focal = frame.subset(labels);
        validateMass(value, frame.format(focal));
        merged[focal] += value;
    }
    return merged;
}

MassFunction MassFunction::create(const LabelMasses& masses) {
    std::vector<std::string> labels;
    for (const auto& entry : masses) {
        labels.insert(labels.end(), entry.first.begin(), entry.first.end());
    }
    Frame inferred(labels);
    return create(inferred, fromLabels(inferred, masses), false);
}

MassFunction MassFunction::create(const LabelMasses& masses, const Frame& frame) {
    return create(frame, fromLabels(frame, masses), true);
}

MassFunction MassFunction::fromStrings(const std::map<std::string, double>& masses) {
    LabelMasses parsed;
    for (const auto& [key, value] : masses) {
        parsed.push_back(std::make_pair(Frame::parseLabels(key), value));
    }
    return create(parsed);
}

MassFunction MassFunction::fromStrings(const std::map<std::string, double>& masses,
        const Frame& frame) {
    LabelMasses parsed;
    for (const auto& [key, value] : masses) {
        parsed.push_back(std::make_pair(Frame::parseLabels(key), value));
    }
    return create(parsed, frame);
}

MassFunction MassFunction::vacuous(const Frame& frame) {
    MassMap masses;
    masses[frame.universe()] = 1.0;
    return MassFunction(frame, masses, true);
}

std::vector<Subset> MassFunction::focalElements() const {
    std::vector<Subset> result;
    for (const auto& entry : _masses) {
        result.push_back(entry.first);
    }
    return result;
}

double MassFunction::mass(const Subset& subset) const {
    auto it = _masses.find(subset);
    return it != _masses.end() ? it->second : 0.0;
}

double MassFunction::mass(const std::vector<std::string>& labels) const {
    return mass(_frame.subset(labels));
}

double MassFunction::conflictMass() const {
    return mass(Subset());
}

double MassFunction::total() const {
    double sum = 0.0;
    for (const auto& entry : _masses) {
        sum += entry.second;
    }
    return sum;
}

bool MassFunction::isNormalized() const {
    return std::abs(total() - 1.0) < constants::NORMALIZATION_TOLERANCE;
}

double MassFunction::belief(const Subset& hypothesis) const {
    double sum = 0.0;
    for (const auto& [focal, value] : _masses) {
        if (!focal.empty() && focal.isSubsetOf(hypothesis)) {
            sum += value;
        }
    }
    return sum;
}

double MassFunction::belief(const std::vector<std::string>& labels) const {
    return belief(_frame.subset(labels));
}

double MassFunction::plausibility(const Subset& hypothesis) const {
    double sum = 0.0;
    for (const auto& [focal, value] : _masses) {
        if (focal.intersects(hypothesis)) {
            sum += value;
        }
    }
    return sum;
}

double MassFunction::plausibility(const std::vector<std::string>& labels) const {
    return plausibility(_frame.subset(labels));
}

double MassFunction::commonality(const Subset& hypothesis) const {
    double sum = 0.0;
    for (const auto& [focal, value] : _masses) {
        if (hypothesis.isSubsetOf(focal)) {
            sum += value;
        }
    }
    return sum;
}

double MassFunction::commonality(const std::vector<std::string>& labels) const {
    return commonality(_frame.subset(labels));
}

MassFunction MassFunction::normalize() const {
    MassMap kept;
    double sum = 0.0;
    for (const auto& [focal, value] : _masses) {
        if (!focal.empty()) {
            kept[focal] = value;
            sum += value;
        }
    }
    if (kept.empty() || sum <= 0.0) {
        throw TotalConflict("All mass is assigned to the empty set");
    }
    for (auto& entry : kept) {
        entry.second /= sum;
    }
    return MassFunction(_frame, kept, _explicitFrame);
}

MassFunction MassFunction::withFrame(const Frame& frame, bool explicitFrame) const {
    if (frame == _frame) {
        return MassFunction(_frame, _masses, explicitFrame);
    }
    MassMap translated;
    for (const auto& [focal, value] : _masses) {
        translated[frame.translate(focal, _frame)] += value;
    }
    return MassFunction(frame, translated, explicitFrame);
}

bool MassFunction::equals(const MassFunction& other, double tolerance) const {
    std::map<std::string, std::pair<double, double> > byLabel;
    for (const auto& [focal, value] : _masses) {
        byLabel[format(focal)].first += value;
    }
    for (const auto& [focal, value] : other._masses) {
        byLabel[other.format(focal)].second += value;
    }
    for (const auto& entry : byLabel) {
        if (std::abs(entry.second.first - entry.second.second) > tolerance) {
            return false;
        }
    }
    return true;
}

std::string MassFunction::toString() const {
    std::vector<Subset> ordered = focalElements();
    std::sort(ordered.begin(), ordered.end(),
            [](const Subset& a, const Subset& b) {
                if (a.size() != b.size()) {
                    return a.size() < b.size();
                }
                return a < b;
            });
    std::ostringstream oss;
    oss << "{";
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << format(ordered[i]) << ": " << std::fixed << std::setprecision(4)
                << mass(ordered[i]);
    }
    oss << "}";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const MassFunction& m) {
    os << "MassFunction(" << m.toString() << ")";
    return os;
}

AlignedOperands alignOperands(const std::vector<MassFunction>& operands) {
    const Frame* declared = nullptr;
    for (const auto& m : operands) {
        if (!m.hasExplicitFrame()) {
            continue;
        }
        if (declared == nullptr) {
            declared = &m.frame();
        } else if (*declared != m.frame()) {
            std::ostringstream oss;
            oss << "Frames of discernment must be compatible: " << *declared
                    << " vs " << m.frame();
            throw FrameMismatch(oss.str());
        }
    }

    AlignedOperands aligned;
    if (declared != nullptr) {
        aligned.frame = *declared;
        aligned.explicitFrame = true;
    } else {
        for (const auto& m : operands) {
            aligned.frame = aligned.frame.unite(m.frame());
        }
        aligned.explicitFrame = false;
    }
    for (const auto& m : operands) {
        aligned.operands.push_back(m.withFrame(aligned.frame, aligned.explicitFrame));
    }
    return aligned;
}

}
