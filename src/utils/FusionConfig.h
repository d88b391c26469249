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

#ifndef UTILS_FUSIONCONFIG_H_
#define UTILS_FUSIONCONFIG_H_

#include <map>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include "../common/Constants.h"

namespace dsfusion {

/**
 * Settings of a fusion run, read from a JSON file:
 *
 *   { "rule": "yager",
 *     "discount": { "alpha": 0.9, "contextual": { "A": 0.2 } },
 *     "queries": ["{A}", "{A,B}"],
 *     "log": { "path": "logs/fusion" },
 *     "output": { "precision": 10 } }
 *
 * Every key is optional.
 */
struct FusionConfig {
    std::string rule = rule::DEMPSTER;
    boost::optional<double> alpha;                  // classical discounting
    std::map<std::string, double> contextualAlphas; // per-element discount rates
    std::vector<std::string> queries;               // subsets to evaluate
    std::string logPath;                            // empty disables the logger
    int precision = constants::DEFAULT_OUTPUT_PRECISION;

    /**
     * @throws ValidationError on unreadable files, malformed values or an
     *         unknown rule name
     */
    static FusionConfig load(const std::string& filename);
    static FusionConfig fromPtree(const boost::property_tree::ptree& root);
};

}

#endif /* UTILS_FUSIONCONFIG_H_ */
