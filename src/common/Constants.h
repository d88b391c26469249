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

#ifndef COMMON_CONSTANTS_H_
#define COMMON_CONSTANTS_H_

#include <cstddef>

namespace dsfusion {
namespace constants {

// a mass function is normalized when its total is within this distance of 1
const double NORMALIZATION_TOLERANCE = 1e-10;
// accumulated masses at or below this value are pruned from results
const double PRUNE_EPSILON = 1e-12;
// reconstructed masses below minus this value mean the weights are invalid
const double RECONSTRUCTION_TOLERANCE = 1e-9;
// DASS documents accept a looser per-source sum
const double DOCUMENT_SUM_TOLERANCE = 1e-3;

// subsets are bitmasks over the frame ordering
const std::size_t MAX_FRAME_SIZE = 64;
// 3^n superset enumerations in the canonical decomposition
const std::size_t MAX_DECOMPOSITION_FRAME_SIZE = 16;
// dense 2^n x 2^n generalization matrix
const std::size_t MAX_CONTEXTUAL_FRAME_SIZE = 10;

const int DEFAULT_OUTPUT_PRECISION = 10;

}

namespace rule {
const char DEMPSTER[] = "dempster";
const char CONJUNCTIVE[] = "conjunctive";
const char DISJUNCTIVE[] = "disjunctive";
const char YAGER[] = "yager";
const char DUBOIS_PRADE[] = "dubois_prade";
const char ZHANG[] = "zhang";
const char PCR5[] = "pcr5";
const char PCR6[] = "pcr6";
const char CAUTIOUS[] = "cautious";
const char BOLD[] = "bold";
}

}

#endif /* COMMON_CONSTANTS_H_ */
