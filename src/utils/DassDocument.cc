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

#include "DassDocument.h"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <boost/optional.hpp>
#include "../common/Exceptions.h"
#include "../common/Util.h"

namespace json = boost::json;

namespace dsfusion {

namespace {

// integers and doubles are numbers, quoted digits are not
boost::optional<double> numberValue(const json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    return boost::none;
}

std::string toString(json::string_view text) {
    return std::string(text.data(), text.size());
}

}

DassDocument::DassDocument(const Frame& frame, const std::vector<Source>& sources)
    : frame(frame), sources(sources) {
}

DassDocument DassDocument::load(const std::string& filename) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw ValidationError("Error reading DASS file: cannot open " + filename);
    }
    std::ostringstream text;
    text << in.rdbuf();
    return parse(text.str());
}

DassDocument DassDocument::parse(const std::string& text) {
    json::error_code ec;
    json::value root = json::parse(text, ec);
    if (ec) {
        throw ValidationError("Error reading DASS file: " + ec.message());
    }
    return fromJson(root);
}

DassDocument DassDocument::fromJson(const json::value& root) {
    if (!root.is_object()) {
        throw ValidationError("A DASS document must be a JSON object");
    }
    const json::object& object = root.as_object();
    const json::value* frameNode = object.if_contains("frame_of_discernment");
    if (!frameNode) {
        throw ValidationError("Missing required field: frame_of_discernment");
    }
    const json::value* sourcesNode = object.if_contains("bba_sources");
    if (!sourcesNode) {
        throw ValidationError("Missing required field: bba_sources");
    }

    // Parse the frame
    if (!frameNode->is_array() || frameNode->as_array().empty()) {
        throw ValidationError("frame_of_discernment must be a non-empty list");
    }
    std::vector<std::string> labels;
    std::set<std::string> seen;
    for (const json::value& element : frameNode->as_array()) {
        if (!element.is_string()) {
            throw ValidationError("frame_of_discernment must list strings, got "
                                  + json::serialize(element));
        }
        std::string label = toString(element.as_string());
        if (!Frame::isValidLabel(label)) {
            throw ValidationError("Invalid frame element: '" + label + "'");
        }
        if (!seen.insert(label).second) {
            throw ValidationError("frame_of_discernment contains duplicates: " + label);
        }
        labels.push_back(label);
    }
    Frame frame(labels);

    // Parse the sources
    if (!sourcesNode->is_array() || sourcesNode->as_array().empty()) {
        throw ValidationError("bba_sources must be a non-empty list");
    }
    std::vector<Source> sources;
    std::size_t index = 0;
    for (const json::value& source : sourcesNode->as_array()) {
        sources.push_back(parseSource(source, frame, index));
        index++;
    }

    DassDocument document(frame, sources);
    const json::value* metadata = object.if_contains("metadata");
    if (metadata && metadata->is_object()) {
        const json::value* description = metadata->as_object().if_contains("description");
        if (description && description->is_string()) {
            document.description = toString(description->as_string());
        }
    }
    return document;
}

DassDocument::Source DassDocument::parseSource(const json::value& node,
                                               const Frame& frame, std::size_t index) {
    std::string prefix = "Source " + std::to_string(index) + ": ";
    if (!node.is_object()) {
        throw ValidationError(prefix + "must be an object");
    }
    const json::value* bba = node.as_object().if_contains("bba");
    if (!bba) {
        throw ValidationError(prefix + "missing field 'bba'");
    }
    if (!bba->is_object() || bba->as_object().empty()) {
        throw ValidationError(prefix + "bba must be a non-empty object");
    }

    MassFunction::LabelMasses masses;
    double totalMass = 0.0;
    for (const json::key_value_pair& entry : bba->as_object()) {
        std::string key = toString(entry.key());
        boost::optional<double> mass = numberValue(entry.value());
        if (!mass || std::isnan(*mass)) {
            throw ValidationError(prefix + "mass for '" + key + "' must be a number, got "
                                  + json::serialize(entry.value()));
        }
        if (*mass < 0.0 || *mass > 1.0) {
            throw ValidationError(prefix + "mass for '" + key + "' must be between 0 and 1");
        }
        std::vector<std::string> subset = Frame::parseLabels(key);
        for (const auto& label : subset) {
            if (!frame.contains(label)) {
                throw ValidationError(prefix + "element '" + label + "' from '" + key
                                      + "' is not in the frame");
            }
        }
        masses.push_back(std::make_pair(subset, *mass));
        totalMass += *mass;
    }

    if (std::abs(totalMass - 1.0) > constants::DOCUMENT_SUM_TOLERANCE) {
        std::ostringstream oss;
        oss << prefix << "sum of masses = " << std::fixed << std::setprecision(4)
            << totalMass << ", expected 1.0";
        throw ValidationError(oss.str());
    }

    std::string id = "source_" + std::to_string(index + 1);
    const json::value* idNode = node.as_object().if_contains("id");
    if (idNode) {
        if (!idNode->is_string()) {
            throw ValidationError(prefix + "id must be a string");
        }
        id = toString(idNode->as_string());
    }
    Source source{ id, MassFunction::create(masses, frame) };
    return source;
}

std::vector<MassFunction> DassDocument::getMassFunctions() const {
    std::vector<MassFunction> result;
    for (const auto& source : sources) {
        result.push_back(source.bba);
    }
    return result;
}

json::object DassDocument::formatMasses(const MassFunction& m, int precision) {
    json::object node;
    for (const auto& [focal, value] : m) {
        node[m.format(focal)] = util::roundTo(value, precision);
    }
    return node;
}

json::object DassDocument::toJson(int precision) const {
    json::object root;
    json::object metadata;
    metadata["format"] = "DASS";
    metadata["version"] = "1.0";
    metadata["description"] = description;
    root["metadata"] = std::move(metadata);

    json::array frameArray;
    for (const auto& label : frame) {
        frameArray.emplace_back(label);
    }
    root["frame_of_discernment"] = std::move(frameArray);

    json::array sourcesArray;
    for (const auto& source : sources) {
        json::object node;
        node["id"] = source.id;
        node["bba"] = formatMasses(source.bba, precision);
        sourcesArray.emplace_back(std::move(node));
    }
    root["bba_sources"] = std::move(sourcesArray);
    return root;
}

void DassDocument::save(const std::string& filename, int precision) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open DASS file for writing: " + filename);
    }
    out << json::serialize(toJson(precision)) << std::endl;
}

}
