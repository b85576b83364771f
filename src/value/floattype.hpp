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

#ifndef FPRV_FLOATTYPE_HPP
#define FPRV_FLOATTYPE_HPP

#include <string>
#include <vector>

#include "../util/option.hpp"

/**
 * The IEEE-754 binary formats a rule can be instantiated with.
 * Widths are given as z3 expects them (the significand width includes the hidden bit).
 */
namespace FloatType {

    enum Type { Half, Single, Double };

    const std::vector<Type> all = {Half, Single, Double};

    std::string name(Type t);

    // accepts the names used in rule files ("half", "float", "double")
    option<Type> parse(const std::string &name);

    unsigned exponentBits(Type t);
    unsigned significandBits(Type t);
}

#endif // FPRV_FLOATTYPE_HPP
