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

#include "FusionHost.h"

#include <fstream>
#include <memory>

#include "../common/Exceptions.h"
#include "../common/Util.h"
#include "../utils/FusionLogger.h"

namespace json = boost::json;

namespace dsfusion {

FusionHost::FusionHost() {
}

FusionHost::~FusionHost() {
}

std::string FusionHost::usage() {
    return "usage: dsfuse <input.dass.json> [--config file] [--rule name] [--alpha a]\n"
           "              [--output file] [--log base] [--query \"{A,B}\"]...\n"
           "rules: " + util::join(ruleNames(), ", ");
}

FusionHost::Options FusionHost::parseArguments(const std::vector<std::string>& args) {
    Options options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() < 2 || arg.compare(0, 2, "--") != 0) {
            if (!options.input.empty()) {
                throw UsageError("Unexpected argument " + arg);
            }
            options.input = arg;
            continue;
        }
        if (i + 1 == args.size()) {
            throw UsageError("Missing value for " + arg);
        }
        const std::string& value = args[++i];
        if (arg == "--config") {
            options.configPath = value;
        } else if (arg == "--rule") {
            options.rule = value;
        } else if (arg == "--alpha") {
            std::size_t used = 0;
            try {
                options.alpha = std::stod(value, &used);
            } catch (const std::logic_error&) {
                used = 0;
            }
            if (used == 0 || used != value.size()) {
                throw UsageError("Malformed reliability " + value);
            }
        } else if (arg == "--output") {
            options.outputPath = value;
        } else if (arg == "--log") {
            options.logPath = value;
        } else if (arg == "--query") {
            options.queries.push_back(value);
        } else {
            throw UsageError("Unknown option " + arg);
        }
    }
    if (options.input.empty()) {
        throw UsageError("No input document given");
    }
    return options;
}

FusionConfig FusionHost::resolveConfig(const Options& options) {
    FusionConfig config;
    if (!options.configPath.empty()) {
        config = FusionConfig::load(options.configPath);
    }
    if (options.rule) {
        makeRule(*options.rule);
        config.rule = *options.rule;
    }
    if (options.alpha) {
        config.alpha = options.alpha;
    }
    if (options.logPath) {
        config.logPath = *options.logPath;
    }
    config.queries.insert(config.queries.end(), options.queries.begin(), options.queries.end());
    return config;
}

json::object FusionHost::process(const DassDocument& document,
                                 const FusionConfig& config,
                                 std::ostream& log) {
    engine.setCombinationRule(config.rule);

    std::shared_ptr<FusionLogger> logger;
    if (!config.logPath.empty()) {
        logger = std::make_shared<FusionLogger>(config.logPath);
    }
    engine.setLogger(logger);

    std::vector<MassFunction> sources = document.getMassFunctions();
    log << "Frame: " << document.getFrame() << std::endl;
    log << "Sources: " << sources.size() << std::endl;

    bool discounted = false;
    if (config.alpha) {
        log << "Classical discounting, alpha = " << *config.alpha << std::endl;
        sources = engine.discount(sources, *config.alpha);
        discounted = true;
    }
    if (!config.contextualAlphas.empty()) {
        log << "Contextual discounting:" << std::endl;
        util::printMap(config.contextualAlphas, log);
        sources = engine.discountContextual(sources, config.contextualAlphas);
        discounted = true;
    }

    log << "Combining with " << engine.getCombinationRule().name() << std::endl;
    MassFunction result = engine.fuse(sources);
    log << "Result: " << result << std::endl;

    if (logger) {
        logger->flush();
    }

    json::object report;
    report["rule"] = engine.getCombinationRule().name();
    json::array frameNode;
    for (const std::string& label : result.frame()) {
        frameNode.emplace_back(label);
    }
    report["frame"] = std::move(frameNode);
    report["sources"] = sources.size();

    if (discounted) {
        json::array discountedNode;
        for (std::size_t i = 0; i < sources.size(); ++i) {
            json::object source;
            source["id"] = document.getSources()[i].id;
            source["bba"] = DassDocument::formatMasses(sources[i], config.precision);
            discountedNode.emplace_back(std::move(source));
        }
        report["discounted"] = std::move(discountedNode);
    }
    report["result"] = DassDocument::formatMasses(result, config.precision);

    if (!config.queries.empty()) {
        log << "Queries: ";
        util::printVector(config.queries, log);
        json::array queries;
        for (const std::string& text : config.queries) {
            Subset hypothesis = result.frame().parse(text);
            json::object query;
            query["subset"] = result.format(hypothesis);
            query["belief"] = result.belief(hypothesis);
            query["plausibility"] = result.plausibility(hypothesis);
            query["commonality"] = result.commonality(hypothesis);
            queries.emplace_back(std::move(query));
        }
        report["queries"] = std::move(queries);
    }
    return report;
}

int FusionHost::run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    Options options;
    try {
        options = parseArguments(args);
    } catch (const UsageError& e) {
        err << e.what() << std::endl << usage() << std::endl;
        return 1;
    }

    try {
        FusionConfig config = resolveConfig(options);
        DassDocument document = DassDocument::load(options.input);
        // diagnostics share the error stream when the report goes to out
        std::ostream& log = options.outputPath.empty() ? err : out;
        json::object report = process(document, config, log);

        if (options.outputPath.empty()) {
            out << json::serialize(report) << std::endl;
        } else {
            std::ofstream file(options.outputPath);
            if (!file.is_open()) {
                throw std::runtime_error("Cannot write report to " + options.outputPath);
            }
            file << json::serialize(report) << std::endl;
            out << "Report written to " << options.outputPath << std::endl;
        }
    } catch (const TotalConflict& e) {
        err << "Total conflict: " << e.what() << std::endl;
        return 2;
    } catch (const DSError& e) {
        err << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::runtime_error& e) {
        // log or report files that cannot be created
        err << "I/O error: " << e.what() << std::endl;
        return 2;
    }
    return 0;
}

}
