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

#ifndef FPRV_SYMBOLICFLOAT_HPP
#define FPRV_SYMBOLICFLOAT_HPP

#include <ostream>
#include <set>
#include <string>

#include "../util/option.hpp"
#include "../exceptions.hpp"

/**
 * An abstract floating-point operand or result.
 *
 * A SymbolicFloat is exactly one of
 *  - a named variable (an input such as %x or a constant such as C),
 *  - a literal of some class (finite literals also carry their value),
 *  - undefined, together with the classes it may take,
 *  - poison.
 *
 * The results of comparisons are one-bit values, they are literals of the classes True and False.
 */
class SymbolicFloat {
public:
    enum Kind { Variable, Literal, Undefined, Poison };

    enum Class { PosZero, NegZero, PosInfinity, NegInfinity, NaN, Finite, True, False };

    typedef std::set<Class> ClassSet;

    // all classes of floating-point values and of one-bit values, respectively
    static const ClassSet FloatClasses;
    static const ClassSet BoolClasses;

    static SymbolicFloat variable(const std::string &name);

    // classifies the given value, so literal(-0.0) is a NegZero literal
    static SymbolicFloat literal(double value);

    // classes other than Finite do not need a value
    static SymbolicFloat ofClass(Class cls);

    static SymbolicFloat boolean(bool value);
    static SymbolicFloat posZero();
    static SymbolicFloat negZero();
    static SymbolicFloat infinity(bool negative);
    static SymbolicFloat nan();

    // an undefined floating-point value that may take any class
    static SymbolicFloat undefined();
    static SymbolicFloat undefined(const ClassSet &classes);

    static SymbolicFloat poison();

    Kind getKind() const { return kind; }
    bool isVariable() const { return kind == Variable; }
    bool isLiteral() const { return kind == Literal; }
    bool isUndefined() const { return kind == Undefined; }
    bool isPoison() const { return kind == Poison; }

    // the name of a variable
    const std::string& getName() const;

    // the classes this value may take (a single one for literals, none for poison)
    ClassSet possibleClasses() const;

    // the numeric value of a floating-point literal (NaN for NaN), none for one-bit literals
    option<double> getValue() const;

    bool isBoolean() const;

    bool operator==(const SymbolicFloat &that) const;
    bool operator!=(const SymbolicFloat &that) const;

    static std::string className(Class cls);

    friend std::ostream& operator<<(std::ostream &s, const SymbolicFloat &v);

private:
    SymbolicFloat(Kind kind);

    Kind kind;
    std::string name;
    Class cls = NaN;
    double value = 0;
    ClassSet classes;
};


/**
 * The class of a literal. Throws NotConcrete for anything else.
 */
SymbolicFloat::Class classify(const SymbolicFloat &v);

// these are true only if v is a literal of the respective class
bool isNaN(const SymbolicFloat &v);
bool isInfinite(const SymbolicFloat &v);
bool isZero(const SymbolicFloat &v);

// true for -0.0 only
bool isSignedZero(const SymbolicFloat &v);

/**
 * Whether b (the rhs result) is an acceptable realization of a (the lhs result).
 *
 *  - everything refines poison, poison refines nothing else
 *  - b refines an undefined a if every class b may take is one a may take
 *  - an undefined b refines a literal a only if b is fixed to a's class and that class has a single value
 *  - literals refine each other if their classes (and, for finite values, their values) coincide;
 *    NaN refines NaN regardless of the payload
 *
 * Variables are not concrete, NotConcrete is thrown for them.
 */
bool refines(const SymbolicFloat &a, const SymbolicFloat &b);

#endif // FPRV_SYMBOLICFLOAT_HPP
