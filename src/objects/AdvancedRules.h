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

#ifndef OBJECTS_ADVANCEDRULES_H_
#define OBJECTS_ADVANCEDRULES_H_

#include "MassFunction.h"

namespace dsfusion {

/*
 * Conflict-redistributing rules. Each starts from the unnormalized
 * conjunctive combination, removes the conflict mass K and reassigns it.
 */

/**
 * Yager (1987): K is transferred to Ω.
 */
MassFunction combineYager(const MassFunction& m1, const MassFunction& m2);

/**
 * Dubois & Prade (1988): the product of every conflicting pair (A,B) is
 * transferred to A∪B.
 */
MassFunction combineDuboisPrade(const MassFunction& m1, const MassFunction& m2);

/**
 * Zhang's center combination rule (1994):
 * m(C) = k Σ_{A∩B=C} |C| / (|A| |B|) m1(A) m2(B) for C ≠ ∅, with k chosen
 * so that the result sums to 1.
 * @throws TotalConflict when every pair of focal sets is disjoint
 */
MassFunction combineZhang(const MassFunction& m1, const MassFunction& m2);

}

#endif /* OBJECTS_ADVANCEDRULES_H_ */
