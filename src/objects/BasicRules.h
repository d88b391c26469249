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

#ifndef OBJECTS_BASICRULES_H_
#define OBJECTS_BASICRULES_H_

#include <functional>
#include <vector>

#include "MassFunction.h"

namespace dsfusion {

class CombinationRule;

typedef std::function<MassFunction(const MassFunction&, const MassFunction&)> BinaryRule;

/**
 * Conjunctive combination: m(C) = Σ_{A∩B=C} m1(A)m2(B), conflict included.
 * With normalization this is Dempster's rule.
 * @throws TotalConflict if normalization is requested and every product
 *         falls on the empty set
 */
MassFunction combineConjunctive(const MassFunction& m1, const MassFunction& m2,
        bool normalization = true);

/**
 * Disjunctive combination: m(C) = Σ_{A∪B=C} m1(A)m2(B).
 */
MassFunction combineDisjunctive(const MassFunction& m1, const MassFunction& m2);

/**
 * Degree of conflict K = Σ_{A∩B=∅} m1(A)m2(B).
 */
double conflictBetween(const MassFunction& m1, const MassFunction& m2);

/**
 * Left fold of a rule over the sources in the given order,
 * ((m1 ⊕ m2) ⊕ m3) ⊕ ... The order matters for rules that are not
 * associative (PCR5, cautious, bold).
 * @throws ValidationError for an empty source list
 */
MassFunction combineMultiple(const std::vector<MassFunction>& sources,
        const BinaryRule& rule);
MassFunction combineMultiple(const std::vector<MassFunction>& sources,
        const CombinationRule& rule);

}

#endif /* OBJECTS_BASICRULES_H_ */
