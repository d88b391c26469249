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

#include "FusionLogger.h"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <filesystem>
#include <stdexcept>
#include <boost/property_tree/json_parser.hpp>
#include "../objects/BasicRules.h"

namespace dsfusion {

FusionLogger::FusionLogger(const std::string& baseFilePath)
    : headerWritten(false) {
    // Create logs directory if it doesn't exist
    std::filesystem::path dir = std::filesystem::path(baseFilePath).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir);
    }

    // Set file paths
    csvFilePath = baseFilePath + ".csv";
    jsonFilePath = baseFilePath + ".json";

    // Open CSV file
    csvFile.open(csvFilePath, std::ios::out);
    if (!csvFile.is_open()) {
        throw std::runtime_error("Failed to open CSV file: " + csvFilePath);
    }
}

FusionLogger::~FusionLogger() {
    if (csvFile.is_open()) {
        csvFile.close();
    }
    // Save JSON data before destruction
    try {
        saveToJson();
    } catch (const std::exception& e) {
        std::cerr << "Failed to write fusion log " << jsonFilePath << ": "
                  << e.what() << std::endl;
    }
}

void FusionLogger::logCombination(const std::string& rule,
                                  const MassFunction& left,
                                  const MassFunction& right,
                                  const MassFunction& result) {
    FusionStep step;
    step.phase = "combination";
    step.method = rule;
    step.leftFocal = left.size();
    step.rightFocal = right.size();
    step.conflict = conflictBetween(left, right);
    step.parameter = 0.0;
    step.resultFocal = result.size();
    step.resultSum = result.total();
    step.result = result.toString();
    record(step);
}

void FusionLogger::logCombination(const std::string& rule,
                                  const std::vector<MassFunction>& sources,
                                  const MassFunction& result) {
    FusionStep step;
    step.phase = "combination";
    step.method = rule;
    step.leftFocal = sources.empty() ? 0 : sources.front().size();
    step.rightFocal = 0;
    for (std::size_t i = 1; i < sources.size(); ++i) {
        step.rightFocal += sources[i].size();
    }
    // N-ary conflict is the mass the unnormalized conjunctive fold sends to ∅
    step.conflict = sources.empty() ? 0.0
            : combineMultiple(sources, [](const MassFunction& a, const MassFunction& b) {
                  return combineConjunctive(a, b, false);
              }).conflictMass();
    step.parameter = 0.0;
    step.resultFocal = result.size();
    step.resultSum = result.total();
    step.result = result.toString();
    record(step);
}

void FusionLogger::logDiscount(const std::string& method,
                               double parameter,
                               const MassFunction& before,
                               const MassFunction& after) {
    FusionStep step;
    step.phase = "discount";
    step.method = method;
    step.leftFocal = before.size();
    step.rightFocal = 0;
    step.conflict = 0.0;
    step.parameter = parameter;
    step.resultFocal = after.size();
    step.resultSum = after.total();
    step.result = after.toString();
    record(step);
}

void FusionLogger::record(FusionStep step) {
    step.index = static_cast<int>(steps.size());
    steps.push_back(step);

    if (!headerWritten) {
        writeCSVHeader();
    }
    writeCSVStep(step);
}

void FusionLogger::writeCSVHeader() {
    csvFile << "Index,Phase,Method,LeftFocal,RightFocal,Conflict,Parameter,"
            << "ResultFocal,ResultSum,Result" << std::endl;
    headerWritten = true;
}

void FusionLogger::writeCSVStep(const FusionStep& step) {
    csvFile << step.index << ","
            << step.phase << ","
            << step.method << ","
            << step.leftFocal << ","
            << step.rightFocal << ","
            << std::fixed << std::setprecision(10) << step.conflict << ","
            << step.parameter << ","
            << step.resultFocal << ","
            << step.resultSum << ",\""
            << step.result << "\"" << std::endl;
}

boost::property_tree::ptree FusionLogger::stepToPtree(const FusionStep& step) {
    boost::property_tree::ptree pt;
    pt.put("index", step.index);
    pt.put("phase", step.phase);
    pt.put("method", step.method);
    pt.put("leftFocal", step.leftFocal);
    pt.put("rightFocal", step.rightFocal);
    pt.put("conflict", step.conflict);
    pt.put("parameter", step.parameter);
    pt.put("resultFocal", step.resultFocal);
    pt.put("resultSum", step.resultSum);
    pt.put("result", step.result);
    return pt;
}

void FusionLogger::saveToJson() {
    boost::property_tree::ptree root;
    boost::property_tree::ptree stepsArray;

    for (const auto& step : steps) {
        stepsArray.push_back(std::make_pair("", stepToPtree(step)));
    }

    root.add_child("steps", stepsArray);

    std::ofstream jsonFile(jsonFilePath);
    boost::property_tree::write_json(jsonFile, root);
    jsonFile.close();
}

void FusionLogger::flush() {
    csvFile.flush();
    saveToJson();
}

}
