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

#include "PCRRules.h"

#include "../common/Exceptions.h"
#include "BasicRules.h"

namespace dsfusion {

MassFunction combinePCR5(const MassFunction& m1, const MassFunction& m2) {
    AlignedOperands aligned = alignOperands({ m1, m2 });
    const MassFunction& a = aligned.operands[0];
    const MassFunction& b = aligned.operands[1];

    MassFunction::MassMap result;
    for (const auto& [h1, v1] : a) {
        for (const auto& [h2, v2] : b) {
            Subset intersection = h1 & h2;
            if (!intersection.empty()) {
                result[intersection] += v1 * v2;
                continue;
            }
            // stored masses are positive, so the sum is too
            double total = v1 + v2;
            result[h1] += v1 * v2 * v1 / total;
            result[h2] += v1 * v2 * v2 / total;
        }
    }
    return MassFunction::fromRaw(aligned.frame, result, aligned.explicitFrame);
}

MassFunction combinePCR6(const std::vector<MassFunction>& sources) {
    if (sources.empty()) {
        throw ValidationError("No mass functions provided");
    }
    if (sources.size() == 1) {
        return sources.front();
    }
    AlignedOperands aligned = alignOperands(sources);
    const std::size_t n = aligned.operands.size();

    std::vector<std::vector<std::pair<Subset, double> > > focals(n);
    for (std::size_t i = 0; i < n; ++i) {
        for (const auto& entry : aligned.operands[i]) {
            focals[i].push_back(entry);
        }
        if (focals[i].empty()) {
            throw ValidationError("Source " + std::to_string(i) + " has no focal elements");
        }
    }

    MassFunction::MassMap result;
    // odometer over the cross product, one focal element per source
    std::vector<std::size_t> choice(n, 0);
    while (true) {
        Subset intersection = aligned.frame.universe();
        double product = 1.0;
        double massSum = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            const auto& picked = focals[i][choice[i]];
            intersection = intersection & picked.first;
            product *= picked.second;
            massSum += picked.second;
        }

        if (!intersection.empty()) {
            result[intersection] += product;
        } else {
            for (std::size_t i = 0; i < n; ++i) {
                const auto& picked = focals[i][choice[i]];
                result[picked.first] += product * picked.second / massSum;
            }
        }

        std::size_t digit = 0;
        while (digit < n && ++choice[digit] == focals[digit].size()) {
            choice[digit] = 0;
            ++digit;
        }
        if (digit == n) {
            break;
        }
    }
    return MassFunction::fromRaw(aligned.frame, result, aligned.explicitFrame);
}

}
