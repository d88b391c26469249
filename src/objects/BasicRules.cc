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

#include "BasicRules.h"

#include "../common/Exceptions.h"
#include "CombinationRule.h"

namespace dsfusion {

MassFunction combineConjunctive(const MassFunction& m1, const MassFunction& m2,
        bool normalization) {
    AlignedOperands aligned = alignOperands({ m1, m2 });
    const MassFunction& a = aligned.operands[0];
    const MassFunction& b = aligned.operands[1];

    MassFunction::MassMap result;
    for (const auto& [h1, v1] : a) {
        for (const auto& [h2, v2] : b) {
            result[h1 & h2] += v1 * v2;
        }
    }

    MassFunction combined = MassFunction::fromRaw(aligned.frame, result,
            aligned.explicitFrame);
    if (normalization) {
        return combined.normalize();
    }
    return combined;
}

MassFunction combineDisjunctive(const MassFunction& m1, const MassFunction& m2) {
    AlignedOperands aligned = alignOperands({ m1, m2 });
    const MassFunction& a = aligned.operands[0];
    const MassFunction& b = aligned.operands[1];

    MassFunction::MassMap result;
    for (const auto& [h1, v1] : a) {
        for (const auto& [h2, v2] : b) {
            result[h1 | h2] += v1 * v2;
        }
    }
    return MassFunction::fromRaw(aligned.frame, result, aligned.explicitFrame);
}

double conflictBetween(const MassFunction& m1, const MassFunction& m2) {
    AlignedOperands aligned = alignOperands({ m1, m2 });
    double conflict = 0.0;
    for (const auto& [h1, v1] : aligned.operands[0]) {
        for (const auto& [h2, v2] : aligned.operands[1]) {
            if (!h1.intersects(h2)) {
                conflict += v1 * v2;
            }
        }
    }
    return conflict;
}

MassFunction combineMultiple(const std::vector<MassFunction>& sources,
        const BinaryRule& rule) {
    if (sources.empty()) {
        throw ValidationError("No mass functions provided");
    }
    MassFunction result = sources.front();
    for (std::size_t i = 1; i < sources.size(); ++i) {
        result = rule(result, sources[i]);
    }
    return result;
}

MassFunction combineMultiple(const std::vector<MassFunction>& sources,
        const CombinationRule& rule) {
    return combineMultiple(sources,
            [&rule](const MassFunction& m1, const MassFunction& m2) {
                return rule.combine(m1, m2);
            });
}

}
