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

#include "operand.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

using namespace std;

Operand::Operand(Kind kind, const std::string &name, const SymbolicFloat &value): kind(kind), name(name), value(value) {}

Operand Operand::input(const std::string &name) {
    return Operand(Input, name, SymbolicFloat::variable(name));
}

Operand Operand::constant(const std::string &name) {
    return Operand(Constant, name, SymbolicFloat::variable(name));
}

Operand Operand::binding(const std::string &name) {
    return Operand(Binding, name, SymbolicFloat::variable(name));
}

Operand Operand::literal(const SymbolicFloat &value) {
    if (value.isVariable()) {
        throw std::invalid_argument("a literal cannot be a variable");
    }
    return Operand(Literal, "", value);
}

option<SymbolicFloat> Operand::parseLiteral(const std::string &str) {
    if (str == "nan") return SymbolicFloat::nan();
    if (str == "inf" || str == "+inf") return SymbolicFloat::infinity(false);
    if (str == "-inf") return SymbolicFloat::infinity(true);
    if (str == "true") return SymbolicFloat::boolean(true);
    if (str == "false") return SymbolicFloat::boolean(false);
    if (str == "undef") return SymbolicFloat::undefined();
    if (str == "poison") return SymbolicFloat::poison();

    if (str.empty() || !(isdigit(str[0]) || str[0] == '-' || str[0] == '+' || str[0] == '.')) {
        return {};
    }
    size_t pos = 0;
    double value;
    try {
        value = std::stod(str, &pos);
    } catch (const std::invalid_argument &) {
        return {};
    } catch (const std::out_of_range &) {
        // beyond double range, but still a valid (infinite) literal
        value = str[0] == '-' ? -numeric_limits<double>::infinity() : numeric_limits<double>::infinity();
        pos = str.size();
    }
    if (pos != str.size()) {
        return {};
    }
    return SymbolicFloat::literal(value);
}

bool Operand::isConstantName(const std::string &name) {
    if (name.empty() || name[0] != 'C') {
        return false;
    }
    for (size_t i = 1; i < name.size(); ++i) {
        if (!isdigit(name[i])) {
            return false;
        }
    }
    return true;
}

const std::string& Operand::getName() const {
    if (kind == Literal) {
        throw std::logic_error("literals have no name");
    }
    return name;
}

const SymbolicFloat& Operand::getValue() const {
    if (kind != Literal) {
        throw NotConcrete(name + " is not a literal");
    }
    return value;
}

bool Operand::operator==(const Operand &that) const {
    return kind == that.kind && name == that.name && value == that.value;
}

bool Operand::operator!=(const Operand &that) const {
    return !(*this == that);
}

std::ostream& operator<<(std::ostream &s, const Operand &op) {
    if (op.kind == Operand::Literal) {
        return s << op.value;
    }
    return s << op.name;
}
