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

#ifndef OBJECTS_CANONICALDECOMPOSITION_H_
#define OBJECTS_CANONICALDECOMPOSITION_H_

#include <map>

#include <dlib/matrix.h>

#include "MassFunction.h"

namespace dsfusion {

// indexed by subset mask, one entry per element of the powerset
typedef dlib::matrix<double, 0, 1> PowersetVector;

/*
 * Weight of every strict subset A ⊊ Ω in the conjunctive decomposition
 * m = ∩_{A⊊Ω} A^{w(A)}, where A^w is the simple mass function with
 * m(A) = 1 - w and m(Ω) = w. A missing key means w(A) = 1.
 */
typedef std::map<Subset, double> WeightFunction;

/**
 * q(A) for every A in the powerset of the mass function's frame.
 */
PowersetVector commonalityVector(const MassFunction& m);

/**
 * Conjunctive weight function (Denœux 2008):
 * w(A) = ∏_{B⊇A} q(B)^{(-1)^{|B|-|A|+1}} for every A ⊊ Ω.
 * Enumerates the full powerset and every superset pair, O(3^|Ω|).
 * @throws DogmaticInputError when some q(B) is zero (m(Ω) = 0)
 * @throws ValidationError when the frame is too large
 */
WeightFunction weightFunction(const MassFunction& m);

/**
 * Canonical conjunctive decomposition of a non-dogmatic mass function.
 * @throws DogmaticInputError when m(∅) > 0 or m(Ω) = 0
 */
WeightFunction canonicalDecomposition(const MassFunction& m);

/**
 * Rebuild a mass function from a weight function: q(C) = ∏_{B⊊Ω, C⊄B} w(B),
 * then m(A) = Σ_{B⊇A} (-1)^{|B|-|A|} q(B). Negative floating error is
 * clamped and the result is normalized.
 * @throws InvalidWeightFunction when some m(A) is below -1e-9
 * @throws TotalConflict if the reconstruction puts all mass on ∅
 */
MassFunction reconstructFromWeights(const Frame& frame, const WeightFunction& weights,
        bool explicitFrame = true);

/**
 * Cautious conjunctive rule: weights combined by min. Idempotent.
 */
MassFunction combineCautious(const MassFunction& m1, const MassFunction& m2);

/**
 * Bold rule: weights combined by max. Idempotent. The max of two weight
 * functions is a weight function only when the operands are separable
 * (every weight at most 1) or close to it.
 * @throws InvalidWeightFunction when the combined weights rebuild to
 *         negative masses
 */
MassFunction combineBold(const MassFunction& m1, const MassFunction& m2);

/*
 * m̄(A) = m(Ω \ A)
 */
MassFunction negation(const MassFunction& m);

/**
 * Disjunctive weights v(A) = w̄(Ω \ A) for every non-empty A, where w̄ is the
 * conjunctive weight function of the negation. m is the disjunction of
 * the negative simple mass functions with m(∅) = v(A) and m(A) = 1 - v(A).
 * @throws DogmaticInputError when m(∅) = 0
 */
WeightFunction disjunctiveWeightFunction(const MassFunction& m);

/**
 * Bold disjunctive rule of Denœux for subnormal mass functions: disjunctive
 * weights combined by min. The result keeps its empty-set mass.
 * @throws DogmaticInputError when an operand has m(∅) = 0
 */
MassFunction combineBoldDisjunctive(const MassFunction& m1, const MassFunction& m2);

}

#endif /* OBJECTS_CANONICALDECOMPOSITION_H_ */
