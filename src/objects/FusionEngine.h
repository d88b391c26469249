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

#ifndef OBJECTS_FUSIONENGINE_H_
#define OBJECTS_FUSIONENGINE_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "CombinationRule.h"
#include "MassFunction.h"
#include "../utils/FusionLogger.h"

namespace dsfusion {

/**
 * Applies a selected combination rule and discounting operators to a set of
 * sources, optionally recording every step with a FusionLogger.
 */
class FusionEngine {
public:
    FusionEngine();
    ~FusionEngine();

    // Rule selection
    template<typename Rule>
    void setCombinationRule();
    void setCombinationRule(const std::string& name);
    const CombinationRule& getCombinationRule() const;

    void setLogger(std::shared_ptr<FusionLogger> logger);

    /**
     * Combine the sources with the current rule, folding left to right
     * unless the rule is N-ary.
     */
    MassFunction fuse(const std::vector<MassFunction>& sources) const;

    // Discount every source
    std::vector<MassFunction> discount(const std::vector<MassFunction>& sources,
                                       double alpha) const;
    std::vector<MassFunction> discountContextual(const std::vector<MassFunction>& sources,
                                                 const std::map<std::string, double>& alphas) const;

private:
    std::unique_ptr<CombinationRule> _rule;
    std::shared_ptr<FusionLogger> _logger;
};

// Template method implementation
template<typename Rule>
void FusionEngine::setCombinationRule() {
    _rule = std::make_unique<Rule>();
}

}

#endif /* OBJECTS_FUSIONENGINE_H_ */
