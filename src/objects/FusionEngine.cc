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

#include "FusionEngine.h"

#include "../common/Exceptions.h"
#include "Discounting.h"

namespace dsfusion {

FusionEngine::FusionEngine() {
    // Dempster's rule by default
    setCombinationRule<DempsterRule>();
}

FusionEngine::~FusionEngine() = default;

void FusionEngine::setCombinationRule(const std::string& name) {
    _rule = makeRule(name);
}

const CombinationRule& FusionEngine::getCombinationRule() const {
    return *_rule;
}

void FusionEngine::setLogger(std::shared_ptr<FusionLogger> logger) {
    _logger = logger;
}

MassFunction FusionEngine::fuse(const std::vector<MassFunction>& sources) const {
    if (sources.empty()) {
        throw ValidationError("No mass functions provided");
    }
    if (!_rule->foldable()) {
        MassFunction result = _rule->combineAll(sources);
        if (_logger) {
            _logger->logCombination(_rule->name(), sources, result);
        }
        return result;
    }

    MassFunction result = sources.front();
    for (std::size_t i = 1; i < sources.size(); ++i) {
        MassFunction next = _rule->combine(result, sources[i]);
        if (_logger) {
            _logger->logCombination(_rule->name(), result, sources[i], next);
        }
        result = next;
    }
    return result;
}

std::vector<MassFunction> FusionEngine::discount(const std::vector<MassFunction>& sources,
                                                 double alpha) const {
    std::vector<MassFunction> result;
    for (const auto& m : sources) {
        result.push_back(discountClassical(m, alpha));
        if (_logger) {
            _logger->logDiscount("classical", alpha, m, result.back());
        }
    }
    return result;
}

std::vector<MassFunction> FusionEngine::discountContextual(
        const std::vector<MassFunction>& sources,
        const std::map<std::string, double>& alphas) const {
    std::vector<MassFunction> result;
    for (const auto& m : sources) {
        result.push_back(dsfusion::discountContextual(m, alphas));
        if (_logger) {
            _logger->logDiscount("contextual", 0.0, m, result.back());
        }
    }
    return result;
}

}
