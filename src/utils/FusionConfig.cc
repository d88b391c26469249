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

#include "FusionConfig.h"
#include <boost/property_tree/json_parser.hpp>
#include "../common/Exceptions.h"
#include "../objects/CombinationRule.h"

namespace pt = boost::property_tree;

namespace dsfusion {

FusionConfig FusionConfig::load(const std::string& filename) {
    pt::ptree root;
    try {
        pt::read_json(filename, root);
    } catch (const pt::json_parser_error& e) {
        throw ValidationError("Error reading configuration: " + std::string(e.what()));
    }
    return fromPtree(root);
}

FusionConfig FusionConfig::fromPtree(const pt::ptree& root) {
    FusionConfig config;
    try {
        config.rule = root.get<std::string>("rule", config.rule);
        if (auto alpha = root.get_child_optional("discount.alpha")) {
            config.alpha = alpha->get_value<double>();
        }
        if (auto contextual = root.get_child_optional("discount.contextual")) {
            for (const pt::ptree::value_type& entry : *contextual) {
                config.contextualAlphas[entry.first] = entry.second.get_value<double>();
            }
        }
        if (auto queries = root.get_child_optional("queries")) {
            for (const pt::ptree::value_type& query : *queries) {
                config.queries.push_back(query.second.data());
            }
        }
        config.logPath = root.get<std::string>("log.path", "");
        config.precision = root.get<int>("output.precision", config.precision);
    } catch (const pt::ptree_error& e) {
        throw ValidationError("Malformed configuration: " + std::string(e.what()));
    }

    // fail early on a misspelt rule
    makeRule(config.rule);
    if (config.precision < 0 || config.precision > 17) {
        throw ValidationError("output.precision must be between 0 and 17");
    }
    return config;
}

}
