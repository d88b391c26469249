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

#ifndef COMMON_EXCEPTIONS_H_
#define COMMON_EXCEPTIONS_H_

#include <stdexcept>
#include <string>

namespace dsfusion {

/*
 * Base class of every error raised by the evidence engine.
 */
class DSError: public std::runtime_error {
public:
    explicit DSError(const std::string& what) :
            std::runtime_error(what) {
    }
};

/*
 * Two operands carry frames with different element sets.
 */
class FrameMismatch: public DSError {
public:
    explicit FrameMismatch(const std::string& what) :
            DSError(what) {
    }
};

/*
 * Normalization was requested but every unit of mass sits on the empty set.
 * The sources are fully contradictory; this is an evidential outcome, not an
 * arithmetic failure.
 */
class TotalConflict: public DSError {
public:
    explicit TotalConflict(const std::string& what) :
            DSError(what) {
    }
};

/*
 * The canonical decomposition is undefined for the given mass function.
 */
class DogmaticInputError: public DSError {
public:
    explicit DogmaticInputError(const std::string& what) :
            DSError(what) {
    }
};

/*
 * Combined weights that rebuild to negative masses. Raised by the bold rule
 * when its operands are not separable.
 */
class InvalidWeightFunction: public DSError {
public:
    explicit InvalidWeightFunction(const std::string& what) :
            DSError(what) {
    }
};

/*
 * A reliability or discount rate outside [0,1].
 */
class InvalidReliability: public DSError {
public:
    explicit InvalidReliability(const std::string& what) :
            DSError(what) {
    }
};

/*
 * A partition that does not cover the frame or has overlapping blocks.
 */
class InvalidPartitionError: public DSError {
public:
    explicit InvalidPartitionError(const std::string& what) :
            DSError(what) {
    }
};

/*
 * Malformed masses, labels outside the declared frame, or malformed documents.
 */
class ValidationError: public DSError {
public:
    explicit ValidationError(const std::string& what) :
            DSError(what) {
    }
};

}

#endif /* COMMON_EXCEPTIONS_H_ */
