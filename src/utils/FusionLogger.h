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

#ifndef UTILS_FUSIONLOGGER_H_
#define UTILS_FUSIONLOGGER_H_

#include <fstream>
#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include "../objects/MassFunction.h"

namespace dsfusion {

class FusionLogger {
public:
    struct FusionStep {
        int index;                  // Position in the log
        std::string phase;          // combination or discount
        std::string method;         // Rule or discounting method name
        std::size_t leftFocal;      // Focal elements of the first operand
        std::size_t rightFocal;     // Focal elements of the second operand, 0 for unary steps
        double conflict;            // Conflict mass K between the operands
        double parameter;           // Reliability for discount steps
        std::size_t resultFocal;    // Focal elements of the result
        double resultSum;           // Total mass of the result
        std::string result;         // Result in interchange form
    };

private:
    std::string csvFilePath;
    std::string jsonFilePath;
    std::ofstream csvFile;
    std::vector<FusionStep> steps;
    bool headerWritten;

public:
    FusionLogger(const std::string& baseFilePath);
    ~FusionLogger();

    // Log a binary combination step
    void logCombination(const std::string& rule,
                        const MassFunction& left,
                        const MassFunction& right,
                        const MassFunction& result);

    // Log an N-ary combination that is not a fold
    void logCombination(const std::string& rule,
                        const std::vector<MassFunction>& sources,
                        const MassFunction& result);

    // Log a discounting step
    void logDiscount(const std::string& method,
                     double parameter,
                     const MassFunction& before,
                     const MassFunction& after);

    const std::vector<FusionStep>& getSteps() const { return steps; }
    const std::string& getCsvFilePath() const { return csvFilePath; }
    const std::string& getJsonFilePath() const { return jsonFilePath; }

    // Save logs to files
    void flush();

private:
    void record(FusionStep step);
    void writeCSVHeader();
    void writeCSVStep(const FusionStep& step);
    boost::property_tree::ptree stepToPtree(const FusionStep& step);
    void saveToJson();
};

}

#endif /* UTILS_FUSIONLOGGER_H_ */
