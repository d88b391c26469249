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

#ifndef OBJECTS_FRAME_H_
#define OBJECTS_FRAME_H_

#include <iostream>
#include <string>
#include <vector>

#include "Subset.h"

namespace dsfusion {

/**
 * A frame of discernment: an immutable, deduplicated collection of atomic
 * hypothesis labels. Labels are kept in lexicographic order, which fixes the
 * bit index of every label and therefore the meaning of every Subset built
 * against this frame. Equality is by content.
 */
class Frame {
public:
    typedef std::vector<std::string>::const_iterator const_iterator;

    /**
     * The empty frame.
     */
    Frame();

    /**
     * Construct a frame from labels. Duplicates are merged.
     * @throws ValidationError for a label outside [A-Za-z0-9_]+ or more
     *         than 64 labels
     */
    explicit Frame(const std::vector<std::string>& labels);

    // [A-Za-z0-9_]+, the labels the "{A,B}" form can carry
    static bool isValidLabel(const std::string& label);

    std::size_t size() const { return _elements.size(); }
    bool empty() const { return _elements.empty(); }
    bool contains(const std::string& label) const;
    const std::vector<std::string>& elements() const { return _elements; }
    const_iterator begin() const { return _elements.begin(); }
    const_iterator end() const { return _elements.end(); }

    /**
     * Bit index of a label.
     * @throws ValidationError if the label is not part of the frame
     */
    std::size_t indexOf(const std::string& label) const;

    // Ω as a subset
    Subset universe() const;
    Subset subset(const std::vector<std::string>& labels) const;
    std::vector<std::string> labels(const Subset& subset) const;

    /**
     * Interchange form "{A,B,C}" (sorted, comma separated) or "{}".
     */
    std::string format(const Subset& subset) const;
    Subset parse(const std::string& text) const;

    /**
     * Re-express a subset of another frame against this one.
     * @throws ValidationError if the subset has labels outside this frame
     */
    Subset translate(const Subset& subset, const Frame& from) const;

    /**
     * All 2^n subsets, restartable.
     * @throws ValidationError when the frame is too large to enumerate
     */
    Powerset powerset() const;

    Frame unite(const Frame& other) const;
    bool isSubframeOf(const Frame& other) const;

    bool operator==(const Frame& other) const { return _elements == other._elements; }
    bool operator!=(const Frame& other) const { return _elements != other._elements; }

    /**
     * Split an interchange string into its labels without a frame.
     * @throws ValidationError when the text is not of the form "{...}"
     */
    static std::vector<std::string> parseLabels(const std::string& text);

private:
    std::vector<std::string> _elements;
};

std::ostream& operator<<(std::ostream& os, const Frame& frame);

}

#endif /* OBJECTS_FRAME_H_ */
