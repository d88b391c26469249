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

#ifndef OBJECTS_SUBSET_H_
#define OBJECTS_SUBSET_H_

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <iterator>

namespace dsfusion {

/**
 * A subset of a frame of discernment, stored as a bitmask indexed by the
 * frame's element ordering. A Subset is meaningless without the Frame that
 * assigned the indices.
 */
class Subset {
public:
    typedef std::uint64_t mask_type;

    Subset() : bits(0) {}
    explicit Subset(mask_type bits) : bits(bits) {}

    static Subset singleton(std::size_t index) {
        return Subset(mask_type(1) << index);
    }

    mask_type mask() const { return bits; }
    bool empty() const { return bits == 0; }
    std::size_t size() const { return std::bitset<64>(bits).count(); }
    bool contains(std::size_t index) const {
        return (bits >> index) & mask_type(1);
    }

    bool isSubsetOf(const Subset& other) const {
        return (bits & ~other.bits) == 0;
    }
    bool isSupersetOf(const Subset& other) const {
        return other.isSubsetOf(*this);
    }
    bool intersects(const Subset& other) const {
        return (bits & other.bits) != 0;
    }

    Subset operator&(const Subset& other) const { return Subset(bits & other.bits); }
    Subset operator|(const Subset& other) const { return Subset(bits | other.bits); }
    // set difference
    Subset operator-(const Subset& other) const { return Subset(bits & ~other.bits); }

    bool operator==(const Subset& other) const { return bits == other.bits; }
    bool operator!=(const Subset& other) const { return bits != other.bits; }
    bool operator<(const Subset& other) const { return bits < other.bits; }

private:
    mask_type bits;
};

/**
 * Restartable range over every subset of a universe, in increasing mask
 * order (the empty set first, the universe last). Only contiguous universes
 * {0..n-1} are enumerated.
 */
class Powerset {
public:
    class iterator {
    public:
        typedef std::forward_iterator_tag iterator_category;
        typedef Subset value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const Subset* pointer;
        typedef Subset reference;

        explicit iterator(Subset::mask_type current) : current(current) {}
        Subset operator*() const { return Subset(current); }
        iterator& operator++() {
            ++current;
            return *this;
        }
        iterator operator++(int) {
            iterator tmp = *this;
            ++current;
            return tmp;
        }
        bool operator==(const iterator& other) const { return current == other.current; }
        bool operator!=(const iterator& other) const { return current != other.current; }

    private:
        Subset::mask_type current;
    };

    explicit Powerset(std::size_t universeSize) :
            count(Subset::mask_type(1) << universeSize) {
    }

    iterator begin() const { return iterator(0); }
    iterator end() const { return iterator(count); }
    Subset::mask_type size() const { return count; }

private:
    Subset::mask_type count;
};

}

#endif /* OBJECTS_SUBSET_H_ */
