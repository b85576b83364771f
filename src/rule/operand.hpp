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

#ifndef FPRV_OPERAND_HPP
#define FPRV_OPERAND_HPP

#include <ostream>
#include <string>

#include "../util/option.hpp"
#include "../value/symbolicfloat.hpp"

/**
 * An operand of an instruction or of a precondition.
 *
 * - Input: a free value of the matched program (%x), it may be undef or poison
 * - Constant: a free constant (C, C1, ...), never undef or poison
 * - Binding: the result of an earlier instruction of the same side (%r)
 * - Literal: a fixed value (0.0, -0.0, nan, inf, true, undef, poison, ...)
 */
class Operand {
public:
    enum Kind { Input, Constant, Binding, Literal };

    static Operand input(const std::string &name);
    static Operand constant(const std::string &name);
    static Operand binding(const std::string &name);
    static Operand literal(const SymbolicFloat &value);

    /**
     * Parses a literal: a decimal number (such as 0.0, -0.0 or 1.5e3), nan, inf, +inf, -inf,
     * true, false, undef or poison.
     */
    static option<SymbolicFloat> parseLiteral(const std::string &str);

    // whether the name is one of a constant (C, C1, C2, ...), as opposed to a %-value
    static bool isConstantName(const std::string &name);

    Kind getKind() const { return kind; }
    bool isInput() const { return kind == Input; }
    bool isConstant() const { return kind == Constant; }
    bool isBinding() const { return kind == Binding; }
    bool isLiteral() const { return kind == Literal; }

    // inputs and constants
    bool isFree() const { return kind == Input || kind == Constant; }

    const std::string& getName() const;
    const SymbolicFloat& getValue() const;

    bool operator==(const Operand &that) const;
    bool operator!=(const Operand &that) const;

    friend std::ostream& operator<<(std::ostream &s, const Operand &op);

private:
    Operand(Kind kind, const std::string &name, const SymbolicFloat &value);

    Kind kind;
    std::string name;
    SymbolicFloat value;
};

#endif // FPRV_OPERAND_HPP
