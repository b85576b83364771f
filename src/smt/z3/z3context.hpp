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

#ifndef FPRV_Z3CONTEXT_HPP
#define FPRV_Z3CONTEXT_HPP

#include "../../value/floattype.hpp"
#include "../../value/symbolicfloat.hpp"

#include <z3++.h>
#include <map>
#include <string>


/**
 * Wrapper around z3 context to allow convenient handling of floating-point terms.
 *
 * All arithmetic rounds to nearest, ties to even.
 *
 * Note that z3 identifies symbols with the same name. Variables are thus always created
 * with a fresh name (by appending a counter to the given base name if necessary).
 */
class Z3Context {

public:
    Z3Context(z3::context& ctx);

    z3::context& getContext() const;

    z3::sort floatSort(FloatType::Type type) const;
    z3::expr roundingMode() const;

    // the closest value of the given type (rounding to nearest, ties to even)
    z3::expr floatVal(double value, FloatType::Type type) const;
    z3::expr zero(FloatType::Type type, bool negative) const;
    z3::expr infinity(FloatType::Type type, bool negative) const;
    z3::expr nan(FloatType::Type type) const;

    // a literal, variables and undefined values cannot be converted
    z3::expr literal(const SymbolicFloat &value, FloatType::Type type) const;

    z3::expr add(const z3::expr &x, const z3::expr &y) const;
    z3::expr sub(const z3::expr &x, const z3::expr &y) const;
    z3::expr mul(const z3::expr &x, const z3::expr &y) const;
    z3::expr div(const z3::expr &x, const z3::expr &y) const;

    // IEEE remainder, i.e., x - y * n where n is x/y rounded to the nearest integer
    z3::expr rem(const z3::expr &x, const z3::expr &y) const;

    z3::expr isNaN(const z3::expr &x) const;
    z3::expr isInfinite(const z3::expr &x) const;
    z3::expr isZero(const z3::expr &x) const;
    z3::expr isNegative(const z3::expr &x) const;
    z3::expr isPositive(const z3::expr &x) const;
    z3::expr isNegativeZero(const z3::expr &x) const;

    // IEEE comparisons, these are false if one of the arguments is NaN
    z3::expr fpEq(const z3::expr &x, const z3::expr &y) const;
    z3::expr fpLt(const z3::expr &x, const z3::expr &y) const;
    z3::expr fpLe(const z3::expr &x, const z3::expr &y) const;
    z3::expr fpGt(const z3::expr &x, const z3::expr &y) const;
    z3::expr fpGe(const z3::expr &x, const z3::expr &y) const;

    // whether x belongs to the given class (x has to be boolean for True and False)
    z3::expr hasClass(const z3::expr &x, SymbolicFloat::Class cls) const;

    z3::expr bTrue() const;
    z3::expr bFalse() const;
    z3::expr boolVal(bool value) const;

    z3::expr floatVar(const std::string &basename, FloatType::Type type);
    z3::expr boolVar(const std::string &basename);

    /**
     * Converts a numeral (e.g., the value of a variable in a model) to a literal.
     * Throws NotConcrete if the given expression is not a numeral.
     */
    SymbolicFloat toSymbolicFloat(const z3::expr &numeral) const;

private:
    std::string generateFreshName(const std::string &basename);

    z3::context &ctx;
    std::map<std::string, int> usedNames;
};

#endif // FPRV_Z3CONTEXT_HPP
