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

#include "CombinationRule.h"

#include "../common/Exceptions.h"
#include "../common/Util.h"

namespace dsfusion {

MassFunction CombinationRule::combineAll(const std::vector<MassFunction>& sources) const {
    return combineMultiple(sources, *this);
}

std::unique_ptr<CombinationRule> makeRule(const std::string& name) {
    if (name == rule::DEMPSTER) {
        return std::make_unique<DempsterRule>();
    } else if (name == rule::CONJUNCTIVE) {
        return std::make_unique<ConjunctiveRule>();
    } else if (name == rule::DISJUNCTIVE) {
        return std::make_unique<DisjunctiveRule>();
    } else if (name == rule::YAGER) {
        return std::make_unique<YagerRule>();
    } else if (name == rule::DUBOIS_PRADE) {
        return std::make_unique<DuboisPradeRule>();
    } else if (name == rule::ZHANG) {
        return std::make_unique<ZhangRule>();
    } else if (name == rule::PCR5) {
        return std::make_unique<PCR5Rule>();
    } else if (name == rule::PCR6) {
        return std::make_unique<PCR6Rule>();
    } else if (name == rule::CAUTIOUS) {
        return std::make_unique<CautiousRule>();
    } else if (name == rule::BOLD) {
        return std::make_unique<BoldRule>();
    }
    throw ValidationError(
            "Unknown combination rule '" + name + "', expected one of: "
                    + util::join(ruleNames(), ", "));
}

std::vector<std::string> ruleNames() {
    return { rule::DEMPSTER, rule::CONJUNCTIVE, rule::DISJUNCTIVE, rule::YAGER,
            rule::DUBOIS_PRADE, rule::ZHANG, rule::PCR5, rule::PCR6,
            rule::CAUTIOUS, rule::BOLD };
}

}
