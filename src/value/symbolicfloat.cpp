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

#include "symbolicfloat.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace std;

const SymbolicFloat::ClassSet SymbolicFloat::FloatClasses = {PosZero, NegZero, PosInfinity, NegInfinity, NaN, Finite};
const SymbolicFloat::ClassSet SymbolicFloat::BoolClasses = {True, False};


SymbolicFloat::SymbolicFloat(Kind kind): kind(kind) {}

SymbolicFloat SymbolicFloat::variable(const std::string &name) {
    SymbolicFloat res(Variable);
    res.name = name;
    return res;
}

SymbolicFloat SymbolicFloat::literal(double value) {
    SymbolicFloat res(Literal);
    if (std::isnan(value)) {
        res.cls = NaN;
    } else if (std::isinf(value)) {
        res.cls = value < 0 ? NegInfinity : PosInfinity;
    } else if (value == 0) {
        res.cls = std::signbit(value) ? NegZero : PosZero;
    } else {
        res.cls = Finite;
    }
    res.value = value;
    return res;
}

SymbolicFloat SymbolicFloat::ofClass(Class cls) {
    switch (cls) {
    case PosZero: return literal(0.0);
    case NegZero: return literal(-0.0);
    case PosInfinity: return literal(numeric_limits<double>::infinity());
    case NegInfinity: return literal(-numeric_limits<double>::infinity());
    case NaN: return literal(numeric_limits<double>::quiet_NaN());
    case True: return boolean(true);
    case False: return boolean(false);
    case Finite: break;
    }
    throw std::invalid_argument("a finite literal needs a value");
}

SymbolicFloat SymbolicFloat::boolean(bool value) {
    SymbolicFloat res(Literal);
    res.cls = value ? True : False;
    return res;
}

SymbolicFloat SymbolicFloat::posZero() {
    return ofClass(PosZero);
}

SymbolicFloat SymbolicFloat::negZero() {
    return ofClass(NegZero);
}

SymbolicFloat SymbolicFloat::infinity(bool negative) {
    return ofClass(negative ? NegInfinity : PosInfinity);
}

SymbolicFloat SymbolicFloat::nan() {
    return ofClass(NaN);
}

SymbolicFloat SymbolicFloat::undefined() {
    return undefined(FloatClasses);
}

SymbolicFloat SymbolicFloat::undefined(const ClassSet &classes) {
    if (classes.empty()) {
        throw std::invalid_argument("an undefined value needs at least one class");
    }
    SymbolicFloat res(Undefined);
    res.classes = classes;
    return res;
}

SymbolicFloat SymbolicFloat::poison() {
    return SymbolicFloat(Poison);
}

const std::string& SymbolicFloat::getName() const {
    if (kind != Variable) {
        throw std::logic_error("only variables have a name");
    }
    return name;
}

SymbolicFloat::ClassSet SymbolicFloat::possibleClasses() const {
    switch (kind) {
    case Literal: return {cls};
    case Undefined: return classes;
    case Poison: return {};
    case Variable: break;
    }
    throw NotConcrete("variable " + name + " has no class");
}

option<double> SymbolicFloat::getValue() const {
    if (kind != Literal || isBoolean()) {
        return {};
    }
    return value;
}

bool SymbolicFloat::isBoolean() const {
    switch (kind) {
    case Literal: return cls == True || cls == False;
    case Undefined: return std::includes(BoolClasses.begin(), BoolClasses.end(), classes.begin(), classes.end());
    default: return false;
    }
}

bool SymbolicFloat::operator==(const SymbolicFloat &that) const {
    if (kind != that.kind) {
        return false;
    }
    switch (kind) {
    case Variable: return name == that.name;
    case Undefined: return classes == that.classes;
    case Poison: return true;
    case Literal:
        if (cls != that.cls) {
            return false;
        }
        return cls != Finite || value == that.value;
    }
    return false;
}

bool SymbolicFloat::operator!=(const SymbolicFloat &that) const {
    return !(*this == that);
}

std::string SymbolicFloat::className(Class cls) {
    switch (cls) {
    case PosZero: return "+0.0";
    case NegZero: return "-0.0";
    case PosInfinity: return "+inf";
    case NegInfinity: return "-inf";
    case NaN: return "nan";
    case Finite: return "finite";
    case True: return "true";
    case False: return "false";
    }
    return "?";
}

std::ostream& operator<<(std::ostream &s, const SymbolicFloat &v) {
    switch (v.kind) {
    case SymbolicFloat::Variable:
        s << v.name;
        break;
    case SymbolicFloat::Poison:
        s << "poison";
        break;
    case SymbolicFloat::Undefined:
        if (v.classes == SymbolicFloat::FloatClasses) {
            s << "undef";
        } else {
            s << "undef{";
            bool first = true;
            for (SymbolicFloat::Class c: v.classes) {
                if (!first) s << ",";
                s << SymbolicFloat::className(c);
                first = false;
            }
            s << "}";
        }
        break;
    case SymbolicFloat::Literal:
        if (v.cls == SymbolicFloat::Finite) {
            std::stringstream str;
            str.precision(17);
            str << v.value;
            s << str.str();
        } else {
            s << SymbolicFloat::className(v.cls);
        }
        break;
    }
    return s;
}


SymbolicFloat::Class classify(const SymbolicFloat &v) {
    if (!v.isLiteral()) {
        std::stringstream s;
        s << "cannot classify " << v;
        throw NotConcrete(s.str());
    }
    return *v.possibleClasses().begin();
}

bool isNaN(const SymbolicFloat &v) {
    return v.isLiteral() && classify(v) == SymbolicFloat::NaN;
}

bool isInfinite(const SymbolicFloat &v) {
    return v.isLiteral() && (classify(v) == SymbolicFloat::PosInfinity || classify(v) == SymbolicFloat::NegInfinity);
}

bool isZero(const SymbolicFloat &v) {
    return v.isLiteral() && (classify(v) == SymbolicFloat::PosZero || classify(v) == SymbolicFloat::NegZero);
}

bool isSignedZero(const SymbolicFloat &v) {
    return v.isLiteral() && classify(v) == SymbolicFloat::NegZero;
}

static bool hasSingleValue(SymbolicFloat::Class cls) {
    return cls != SymbolicFloat::Finite;
}

bool refines(const SymbolicFloat &a, const SymbolicFloat &b) {
    if (a.isVariable() || b.isVariable()) {
        std::stringstream s;
        s << "cannot decide refinement between " << a << " and " << b;
        throw NotConcrete(s.str());
    }
    if (a.isPoison()) {
        return true;
    }
    if (b.isPoison()) {
        return false;
    }
    const SymbolicFloat::ClassSet &as = a.possibleClasses();
    const SymbolicFloat::ClassSet &bs = b.possibleClasses();
    if (a.isUndefined()) {
        return std::includes(as.begin(), as.end(), bs.begin(), bs.end());
    }
    SymbolicFloat::Class cls = classify(a);
    if (b.isUndefined()) {
        return bs.size() == 1 && *bs.begin() == cls && hasSingleValue(cls);
    }
    if (classify(b) != cls) {
        return false;
    }
    return cls != SymbolicFloat::Finite || a.getValue().get() == b.getValue().get();
}
