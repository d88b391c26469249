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

#ifndef OBJECTS_PCRRULES_H_
#define OBJECTS_PCRRULES_H_

#include <vector>

#include "MassFunction.h"

namespace dsfusion {

/**
 * PCR5 (Smarandache & Dezert 2005). The product m1(A)m2(B) of every
 * conflicting pair goes back to A and B in proportion to m1(A) and m2(B).
 */
MassFunction combinePCR5(const MassFunction& m1, const MassFunction& m2);

/**
 * PCR6 (Martin & Osswald 2006) over any number of sources. Enumerates the
 * full cross product of focal elements, one per source, so the cost is the
 * product of the source sizes. The product of a conflicting tuple
 * (X1..Xn) is shared among its members in proportion to mi(Xi). Coincides
 * with PCR5 for two sources.
 * @throws ValidationError for an empty source list
 */
MassFunction combinePCR6(const std::vector<MassFunction>& sources);

}

#endif /* OBJECTS_PCRRULES_H_ */
