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

#ifndef UTILS_DASSDOCUMENT_H_
#define UTILS_DASSDOCUMENT_H_

#include <string>
#include <vector>
#include <boost/json.hpp>
#include "../common/Constants.h"
#include "../objects/Frame.h"
#include "../objects/MassFunction.h"

namespace dsfusion {

/**
 * A DASS document: a frame of discernment and a list of evidence sources,
 * exchanged as JSON of the form
 *
 *   { "metadata": { "format": "DASS", "version": "1.0", "description": "..." },
 *     "frame_of_discernment": ["A", "B", "C"],
 *     "bba_sources": [ { "id": "source_1", "bba": { "{A}": 0.6, "{A,B}": 0.4 } } ] }
 *
 * Subset keys use the "{A,B}" / "{}" interchange form. Masses are JSON
 * numbers on input and on output.
 */
class DassDocument {
public:
    struct Source {
        std::string id;
        MassFunction bba;
    };

    DassDocument(const Frame& frame, const std::vector<Source>& sources);

    /**
     * Read and validate a DASS file. Every source is built with the
     * validated-and-normalized constructor against the declared frame.
     * @throws ValidationError on a malformed document
     */
    static DassDocument load(const std::string& filename);
    static DassDocument parse(const std::string& text);
    static DassDocument fromJson(const boost::json::value& root);

    boost::json::object toJson(int precision = constants::DEFAULT_OUTPUT_PRECISION) const;
    void save(const std::string& filename,
              int precision = constants::DEFAULT_OUTPUT_PRECISION) const;

    const Frame& getFrame() const { return frame; }
    const std::vector<Source>& getSources() const { return sources; }
    std::vector<MassFunction> getMassFunctions() const;

    std::string description;

    /**
     * { "{A,B}": mass } with masses rounded to the given number of digits.
     */
    static boost::json::object formatMasses(const MassFunction& m, int precision);

private:
    Frame frame;
    std::vector<Source> sources;

    static Source parseSource(const boost::json::value& node,
                              const Frame& frame, std::size_t index);
};

}

#endif /* UTILS_DASSDOCUMENT_H_ */
