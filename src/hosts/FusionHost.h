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

#ifndef HOSTS_FUSIONHOST_H_
#define HOSTS_FUSIONHOST_H_

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/json.hpp>

#include "../objects/FusionEngine.h"
#include "../utils/DassDocument.h"
#include "../utils/FusionConfig.h"

namespace dsfusion {

/*
 * Malformed command line.
 */
class UsageError: public std::invalid_argument {
public:
    explicit UsageError(const std::string& what) :
            std::invalid_argument(what) {
    }
};

/**
 * Command-line front end: loads a DASS document, discounts and fuses its
 * sources, answers belief queries and writes a JSON report.
 */
class FusionHost {
public:
    struct Options {
        std::string input;
        std::string configPath;
        std::string outputPath;                 // empty writes to the output stream
        boost::optional<std::string> rule;
        boost::optional<double> alpha;
        boost::optional<std::string> logPath;
        std::vector<std::string> queries;
    };

    FusionHost();
    virtual ~FusionHost();

    /**
     * @throws UsageError on a missing input, an unknown flag or a flag
     *         without its value
     */
    static Options parseArguments(const std::vector<std::string>& args);

    // Configuration file first, then command-line overrides
    static FusionConfig resolveConfig(const Options& options);

    /**
     * Discount and fuse the document sources and build the report. When a
     * discount is configured the report also lists every discounted source
     * under "discounted". Diagnostics go to the log stream.
     */
    boost::json::object process(const DassDocument& document,
                                const FusionConfig& config,
                                std::ostream& log);

    /**
     * Whole program. Returns 0 on success, 1 on a usage error and 2 when
     * the evidence cannot be loaded or fused.
     */
    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

    static std::string usage();

private:
    FusionEngine engine;
};

}

#endif /* HOSTS_FUSIONHOST_H_ */
