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

#ifndef OBJECTS_DISCOUNTING_H_
#define OBJECTS_DISCOUNTING_H_

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <dlib/matrix.h>

#include "MassFunction.h"

namespace dsfusion {

typedef std::vector<std::vector<std::string> > Partition;

/**
 * Classical (Shafer) discounting with reliability alpha:
 * m'(A) = alpha m(A) for A ≠ Ω, m'(Ω) = alpha m(Ω) + (1 - alpha).
 * alpha = 1 is the identity, alpha = 0 gives the vacuous mass function.
 * @throws InvalidReliability if alpha is outside [0,1]
 */
MassFunction discountClassical(const MassFunction& m, double alpha);

/**
 * Contextual discounting with one discount rate per frame element (missing
 * elements have rate 0):
 * m'(A) = Σ_{B⊆A} G(A,B) m(B), G(A,B) = ∏_{ω∈B}(1-α_ω) ∏_{ω∈A\B} α_ω,
 * followed by pruning and renormalization. All rates 0 is the identity,
 * all rates 1 the vacuous mass function.
 * @throws InvalidReliability for a rate outside [0,1]
 * @throws ValidationError for an element outside the frame or a frame too
 *         large for the dense generalization matrix
 */
MassFunction discountContextual(const MassFunction& m,
        const std::map<std::string, double>& alphas);

/**
 * Θ-contextual discounting: the contexts are the blocks of a partition of
 * the frame, with one discount rate per block (missing blocks have rate 0).
 * G(A,B) multiplies, over every block θ, (1-α_θ) if θ meets B, else α_θ if
 * θ meets A, else 1.
 * @throws InvalidPartitionError if the blocks overlap, are empty, leave part
 *         of the frame uncovered, or a rate is keyed by a non-block
 * @throws InvalidReliability for a rate outside [0,1]
 */
MassFunction discountThetaContextual(const MassFunction& m, const Partition& partition,
        const std::map<std::vector<std::string>, double>& alphas);

/**
 * Discounting by context reliability. Contexts are applied in order; for
 * each (context, beta), every focal set contained in the context keeps
 * beta m(A) and transfers (1 - beta) m(A) to Ω. Note beta is a reliability
 * here (1 keeps the mass), not a discount rate.
 * @throws InvalidReliability if beta is outside [0,1]
 */
MassFunction discountByContexts(const MassFunction& m,
        const std::vector<std::pair<std::vector<std::string>, double> >& contexts);

/**
 * Dense generalization matrix over the powerset of the frame, indexed by
 * subset masks: G(A,B) for non-empty B ⊆ A, zero elsewhere.
 */
dlib::matrix<double> generalizationMatrix(const Frame& frame,
        const std::map<std::string, double>& alphas);
dlib::matrix<double> thetaGeneralizationMatrix(const Frame& frame,
        const std::vector<Subset>& blocks, const std::vector<double>& rates);

}

#endif /* OBJECTS_DISCOUNTING_H_ */
