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

#include "CanonicalDecomposition.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <sstream>

#include "../common/Constants.h"
#include "../common/Exceptions.h"

namespace dsfusion {

namespace {

void checkDecomposable(const Frame& frame) {
    if (frame.size() > constants::MAX_DECOMPOSITION_FRAME_SIZE) {
        throw ValidationError(
                "Canonical decomposition supports at most "
                        + std::to_string(constants::MAX_DECOMPOSITION_FRAME_SIZE)
                        + " frame elements, got "
                        + std::to_string(frame.size()));
    }
}

WeightFunction mergeWeights(const WeightFunction& w1, const WeightFunction& w2,
        const std::function<double(double, double)>& pick) {
    WeightFunction merged;
    for (const auto& [focal, w] : w1) {
        auto it = w2.find(focal);
        merged[focal] = pick(w, it != w2.end() ? it->second : 1.0);
    }
    for (const auto& [focal, w] : w2) {
        if (w1.find(focal) == w1.end()) {
            merged[focal] = pick(1.0, w);
        }
    }
    return merged;
}

MassFunction::MassMap reconstructMasses(const Frame& frame, const WeightFunction& weights) {
    checkDecomposable(frame);
    Powerset subsets = frame.powerset();
    const Subset::mask_type full = frame.universe().mask();

    PowersetVector logw = dlib::zeros_matrix<double>(subsets.size(), 1);
    for (const auto& [focal, w] : weights) {
        if (focal.mask() == full || !focal.isSubsetOf(frame.universe())) {
            throw ValidationError(
                    "Weights are defined on strict subsets of the frame only");
        }
        if (!(w > 0.0) || std::isinf(w)) {
            throw ValidationError("Weight of " + frame.format(focal) + " must be positive");
        }
        logw(focal.mask()) = std::log(w);
    }
    const double logTotal = dlib::sum(logw);

    // q(C) = exp(Σ_B ln w(B) - Σ_{B⊇C, B≠Ω} ln w(B))
    PowersetVector q(subsets.size());
    for (Subset c : subsets) {
        const Subset::mask_type complement = full & ~c.mask();
        double above = 0.0;
        Subset::mask_type s = complement;
        while (true) {
            above += logw(c.mask() | s);
            if (s == 0) {
                break;
            }
            s = (s - 1) & complement;
        }
        q(c.mask()) = std::exp(logTotal - above);
    }

    MassFunction::MassMap masses;
    for (Subset a : subsets) {
        const Subset::mask_type complement = full & ~a.mask();
        double value = 0.0;
        Subset::mask_type s = complement;
        while (true) {
            double term = q(a.mask() | s);
            value += Subset(s).size() % 2 == 0 ? term : -term;
            if (s == 0) {
                break;
            }
            s = (s - 1) & complement;
        }
        if (value < -constants::RECONSTRUCTION_TOLERANCE) {
            std::ostringstream oss;
            oss << "Weights do not describe a mass function: m(" << frame.format(a)
                << ") = " << value;
            throw InvalidWeightFunction(oss.str());
        }
        // floating error only
        masses[a] = std::max(value, 0.0);
    }
    return masses;
}

}

PowersetVector commonalityVector(const MassFunction& m) {
    const Frame& frame = m.frame();
    checkDecomposable(frame);
    Powerset subsets = frame.powerset();
    PowersetVector q(subsets.size());
    for (Subset a : subsets) {
        q(a.mask()) = m.commonality(a);
    }
    return q;
}

WeightFunction weightFunction(const MassFunction& m) {
    PowersetVector q = commonalityVector(m);
    const Subset::mask_type full = m.frame().universe().mask();

    // q is decreasing w.r.t. inclusion, so q(Ω) = m(Ω) is the minimum
    if (q(full) <= 0.0) {
        throw DogmaticInputError(
                "Canonical decomposition requires positive mass on the frame");
    }
    PowersetVector logq(q.size());
    for (long i = 0; i < q.size(); ++i) {
        logq(i) = std::log(q(i));
    }

    WeightFunction weights;
    for (Subset::mask_type a = 0; a < full; ++a) {
        const Subset::mask_type complement = full & ~a;
        double logw = 0.0;
        // every B = A ∪ S with S ⊆ Ω \ A
        Subset::mask_type s = complement;
        while (true) {
            double term = logq(a | s);
            logw += Subset(s).size() % 2 == 1 ? term : -term;
            if (s == 0) {
                break;
            }
            s = (s - 1) & complement;
        }
        weights[Subset(a)] = std::exp(logw);
    }
    return weights;
}

WeightFunction canonicalDecomposition(const MassFunction& m) {
    if (m.conflictMass() > 0.0) {
        throw DogmaticInputError(
                "Cannot decompose a mass function with mass on the empty set");
    }
    return weightFunction(m);
}

MassFunction reconstructFromWeights(const Frame& frame, const WeightFunction& weights,
        bool explicitFrame) {
    return MassFunction::fromRaw(frame, reconstructMasses(frame, weights), explicitFrame)
            .normalize();
}

MassFunction negation(const MassFunction& m) {
    const Subset omega = m.frame().universe();
    MassFunction::MassMap masses;
    for (const auto& [focal, value] : m) {
        masses[omega - focal] = value;
    }
    return MassFunction::fromRaw(m.frame(), masses, m.hasExplicitFrame());
}

WeightFunction disjunctiveWeightFunction(const MassFunction& m) {
    if (!(m.conflictMass() > 0.0)) {
        throw DogmaticInputError(
                "Disjunctive decomposition requires positive mass on the empty set");
    }
    const Subset omega = m.frame().universe();
    WeightFunction weights;
    for (const auto& [focal, w] : weightFunction(negation(m))) {
        weights[omega - focal] = w;
    }
    return weights;
}

MassFunction combineCautious(const MassFunction& m1, const MassFunction& m2) {
    AlignedOperands aligned = alignOperands({ m1, m2 });
    WeightFunction w = mergeWeights(canonicalDecomposition(aligned.operands[0]),
            canonicalDecomposition(aligned.operands[1]),
            [](double a, double b) { return std::min(a, b); });
    return reconstructFromWeights(aligned.frame, w, aligned.explicitFrame);
}

MassFunction combineBold(const MassFunction& m1, const MassFunction& m2) {
    AlignedOperands aligned = alignOperands({ m1, m2 });
    WeightFunction w = mergeWeights(canonicalDecomposition(aligned.operands[0]),
            canonicalDecomposition(aligned.operands[1]),
            [](double a, double b) { return std::max(a, b); });
    return reconstructFromWeights(aligned.frame, w, aligned.explicitFrame);
}

MassFunction combineBoldDisjunctive(const MassFunction& m1, const MassFunction& m2) {
    AlignedOperands aligned = alignOperands({ m1, m2 });
    const Subset omega = aligned.frame.universe();
    // min of disjunctive weights v(A) = w̄(Ω \ A), rebuilt on the negation
    WeightFunction v = mergeWeights(disjunctiveWeightFunction(aligned.operands[0]),
            disjunctiveWeightFunction(aligned.operands[1]),
            [](double a, double b) { return std::min(a, b); });
    WeightFunction negated;
    for (const auto& [focal, w] : v) {
        negated[omega - focal] = w;
    }
    MassFunction::MassMap masses;
    for (const auto& [focal, value] : reconstructMasses(aligned.frame, negated)) {
        masses[omega - focal] = value;
    }
    return MassFunction::fromRaw(aligned.frame, masses, aligned.explicitFrame);
}

}
