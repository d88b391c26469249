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

#ifndef UTIL_H_
#define UTIL_H_

#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace dsfusion {
namespace util {
/*
 * Template function to print vectors of any type
 */
template <typename T>
void printVector(const std::vector<T>& vec, std::ostream& os = std::cout) {
    for (const T &element : vec) {
        os << element << "  ";
    }
    os << std::endl;
}

/*
 * Template function to print maps of any key-value types, one entry per line
 */
template <typename K, typename V>
void printMap(const std::map<K, V>& m, std::ostream& os = std::cout) {
    for (const auto& pair : m) {
        os << "  " << pair.first << ": " << pair.second << std::endl;
    }
}

/*
 * Template function to join a container of streamable elements
 */
template <typename T>
std::string join(const T& container, const std::string& separator) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& element : container) {
        if (!first) {
            oss << separator;
        }
        oss << element;
        first = false;
    }
    return oss.str();
}

inline std::string trim(const std::string& s) {
    const char* blanks = " \t\r\n";
    std::string::size_type begin = s.find_first_not_of(blanks);
    if (begin == std::string::npos) {
        return "";
    }
    std::string::size_type end = s.find_last_not_of(blanks);
    return s.substr(begin, end - begin + 1);
}

inline std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream iss(s);
    while (std::getline(iss, token, delimiter)) {
        tokens.push_back(token);
    }
    // "a," yields a trailing empty token
    if (!s.empty() && s.back() == delimiter) {
        tokens.push_back("");
    }
    return tokens;
}

/*
 * Round to a fixed number of decimal digits
 */
inline double roundTo(double value, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

}
}

#endif /* UTIL_H_ */
