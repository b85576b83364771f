/*  This file is part of FPRV.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program. If not, see <http://www.gnu.org/licenses>.
 */

#include "floattype.hpp"

#include <stdexcept>

namespace FloatType {

    std::string name(Type t) {
        switch (t) {
        case Half: return "half";
        case Single: return "float";
        case Double: return "double";
        }
        throw std::invalid_argument("unknown float type");
    }

    option<Type> parse(const std::string &name) {
        for (Type t: all) {
            if (FloatType::name(t) == name) {
                return t;
            }
        }
        return {};
    }

    unsigned exponentBits(Type t) {
        switch (t) {
        case Half: return 5;
        case Single: return 8;
        case Double: return 11;
        }
        throw std::invalid_argument("unknown float type");
    }

    unsigned significandBits(Type t) {
        switch (t) {
        case Half: return 11;
        case Single: return 24;
        case Double: return 53;
        }
        throw std::invalid_argument("unknown float type");
    }

}
