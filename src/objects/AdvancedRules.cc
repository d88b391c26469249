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

#include "AdvancedRules.h"

#include "BasicRules.h"

namespace dsfusion {

namespace {

/*
 * Unnormalized conjunctive result with the empty set removed; the removed
 * mass is returned through conflict.
 */
MassFunction::MassMap stripConflict(const MassFunction& combined, double& conflict) {
    MassFunction::MassMap result = combined.masses();
    conflict = combined.conflictMass();
    result.erase(Subset());
    return result;
}

}

MassFunction combineYager(const MassFunction& m1, const MassFunction& m2) {
    MassFunction combined = combineConjunctive(m1, m2, false);
    double conflict = 0.0;
    MassFunction::MassMap result = stripConflict(combined, conflict);

    result[combined.frame().universe()] += conflict;
    return MassFunction::fromRaw(combined.frame(), result,
            combined.hasExplicitFrame());
}

MassFunction combineDuboisPrade(const MassFunction& m1, const MassFunction& m2) {
    AlignedOperands aligned = alignOperands({ m1, m2 });
    MassFunction combined = combineConjunctive(aligned.operands[0],
            aligned.operands[1], false);
    double conflict = 0.0;
    MassFunction::MassMap result = stripConflict(combined, conflict);

    if (conflict > 0.0) {
        for (const auto& [h1, v1] : aligned.operands[0]) {
            for (const auto& [h2, v2] : aligned.operands[1]) {
                if (!h1.intersects(h2)) {
                    result[h1 | h2] += v1 * v2;
                }
            }
        }
    }
    return MassFunction::fromRaw(aligned.frame, result, aligned.explicitFrame);
}

MassFunction combineZhang(const MassFunction& m1, const MassFunction& m2) {
    AlignedOperands aligned = alignOperands({ m1, m2 });
    MassFunction::MassMap result;
    for (const auto& [h1, v1] : aligned.operands[0]) {
        for (const auto& [h2, v2] : aligned.operands[1]) {
            Subset common = h1 & h2;
            if (common.empty()) {
                continue;
            }
            // r(A,B) = |A∩B| / (|A| |B|)
            double r = static_cast<double>(common.size())
                    / static_cast<double>(h1.size() * h2.size());
            result[common] += r * v1 * v2;
        }
    }
    // k is the normalization over the non-empty intersections
    return MassFunction::fromRaw(aligned.frame, result, aligned.explicitFrame).normalize();
}

}
