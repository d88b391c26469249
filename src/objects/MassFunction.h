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

#ifndef OBJECTS_MASSFUNCTION_H_
#define OBJECTS_MASSFUNCTION_H_

#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "Frame.h"
#include "Subset.h"

namespace dsfusion {

/**
 * A basic belief assignment: a sparse map from focal sets to strictly
 * positive masses, attached to a frame of discernment. Instances are
 * immutable; normalization, combination and discounting all return new
 * instances.
 *
 * The frame is either explicit (supplied by the caller) or inferred from the
 * union of the focal elements. Only explicit frames take part in frame
 * mismatch checks.
 */
class MassFunction {
public:
    typedef std::map<Subset, double> MassMap;
    typedef std::vector<std::pair<std::vector<std::string>, double> > LabelMasses;
    typedef MassMap::const_iterator const_iterator;

    /**
     * Construct without normalization. Every mass is validated (finite and
     * non-negative), zero masses are dropped and the empty set is kept.
     * Intended for intermediate results such as unnormalized conjunctive
     * combination.
     * @throws ValidationError on NaN, infinite or negative masses, or on a
     *         focal set that is not a subset of the frame
     */
    static MassFunction fromRaw(const Frame& frame, const MassMap& masses,
            bool explicitFrame = true);

    /**
     * Construct, validate and normalize. Duplicate keys are merged by
     * summation. The empty-set mass is always removed and the remainder
     * rescaled, so the result is normal and sums to 1.
     * @throws ValidationError on malformed masses or when no positive mass is given
     * @throws TotalConflict when only the empty set carries mass
     */
    static MassFunction create(const Frame& frame, const MassMap& masses,
            bool explicitFrame = true);
    // frame inferred from the labels
    static MassFunction create(const LabelMasses& masses);
    static MassFunction create(const LabelMasses& masses, const Frame& frame);
    // keys in the "{A,B}" interchange form
    static MassFunction fromStrings(const std::map<std::string, double>& masses);
    static MassFunction fromStrings(const std::map<std::string, double>& masses,
            const Frame& frame);

    // total ignorance, all mass on Ω
    static MassFunction vacuous(const Frame& frame);

    const Frame& frame() const { return _frame; }
    bool hasExplicitFrame() const { return _explicitFrame; }
    const MassMap& masses() const { return _masses; }
    const_iterator begin() const { return _masses.begin(); }
    const_iterator end() const { return _masses.end(); }
    std::size_t size() const { return _masses.size(); }

    std::vector<Subset> focalElements() const;
    double mass(const Subset& subset) const;
    double mass(const std::vector<std::string>& labels) const;
    // mass on the empty set
    double conflictMass() const;
    double total() const;
    bool isNormalized() const;

    /**
     * Sum of m(A) over non-empty A ⊆ H.
     */
    double belief(const Subset& hypothesis) const;
    double belief(const std::vector<std::string>& labels) const;

    /**
     * Sum of m(A) over A with A ∩ H ≠ ∅.
     */
    double plausibility(const Subset& hypothesis) const;
    double plausibility(const std::vector<std::string>& labels) const;

    /**
     * Sum of m(A) over A ⊇ H.
     */
    double commonality(const Subset& hypothesis) const;
    double commonality(const std::vector<std::string>& labels) const;

    /**
     * Drop the empty-set mass and rescale the rest to sum to 1.
     * @throws TotalConflict when nothing but conflict remains
     */
    MassFunction normalize() const;

    /**
     * The same masses expressed against a wider (or equal) frame.
     * @throws ValidationError if a focal element does not fit the frame
     */
    MassFunction withFrame(const Frame& frame, bool explicitFrame = true) const;

    /**
     * Compare focal sets by label and masses within a tolerance.
     */
    bool equals(const MassFunction& other, double tolerance = 1e-9) const;

    std::string format(const Subset& subset) const { return _frame.format(subset); }
    std::string toString() const;

private:
    MassFunction(const Frame& frame, const MassMap& masses, bool explicitFrame);

    static MassMap fromLabels(const Frame& frame, const LabelMasses& masses);

    Frame _frame;
    MassMap _masses;
    bool _explicitFrame;
};

std::ostream& operator<<(std::ostream& os, const MassFunction& m);

/**
 * Rule operands re-expressed on the frame that the result carries. Explicit
 * frames must agree; an explicit frame wins over inferred ones; otherwise
 * the union of the inferred frames is used.
 */
struct AlignedOperands {
    Frame frame;
    bool explicitFrame;
    std::vector<MassFunction> operands;
};

/**
 * @throws FrameMismatch when two explicit frames differ
 * @throws ValidationError when an inferred operand has labels outside the
 *         explicit frame
 */
AlignedOperands alignOperands(const std::vector<MassFunction>& operands);

}

#endif /* OBJECTS_MASSFUNCTION_H_ */
