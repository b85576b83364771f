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

#include "z3context.hpp"

#include <z3_fpa.h>
#include <sstream>

using namespace std;

Z3Context::Z3Context(z3::context& ctx): ctx(ctx) { }

z3::context& Z3Context::getContext() const {
    return ctx;
}

z3::sort Z3Context::floatSort(FloatType::Type type) const {
    return ctx.fpa_sort(FloatType::exponentBits(type), FloatType::significandBits(type));
}

z3::expr Z3Context::roundingMode() const {
    Z3_ast r = Z3_mk_fpa_round_nearest_ties_to_even(ctx);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::floatVal(double value, FloatType::Type type) const {
    // double literals are exact in Float64, smaller types are reached by rounding
    z3::expr d = ctx.fpa_val(value);
    if (type == FloatType::Double) {
        return d;
    }
    Z3_ast r = Z3_mk_fpa_to_fp_float(ctx, roundingMode(), d, floatSort(type));
    ctx.check_error();
    return z3::expr(ctx, r).simplify();
}

z3::expr Z3Context::zero(FloatType::Type type, bool negative) const {
    Z3_ast r = Z3_mk_fpa_zero(ctx, floatSort(type), negative);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::infinity(FloatType::Type type, bool negative) const {
    return ctx.fpa_inf(floatSort(type), negative);
}

z3::expr Z3Context::nan(FloatType::Type type) const {
    return ctx.fpa_nan(floatSort(type));
}

z3::expr Z3Context::literal(const SymbolicFloat &value, FloatType::Type type) const {
    switch (classify(value)) {
    case SymbolicFloat::PosZero: return zero(type, false);
    case SymbolicFloat::NegZero: return zero(type, true);
    case SymbolicFloat::PosInfinity: return infinity(type, false);
    case SymbolicFloat::NegInfinity: return infinity(type, true);
    case SymbolicFloat::NaN: return nan(type);
    case SymbolicFloat::Finite: return floatVal(value.getValue().get(), type);
    case SymbolicFloat::True: return bTrue();
    case SymbolicFloat::False: return bFalse();
    }
    throw std::logic_error("unknown class");
}

z3::expr Z3Context::add(const z3::expr &x, const z3::expr &y) const {
    Z3_ast r = Z3_mk_fpa_add(ctx, roundingMode(), x, y);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::sub(const z3::expr &x, const z3::expr &y) const {
    Z3_ast r = Z3_mk_fpa_sub(ctx, roundingMode(), x, y);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::mul(const z3::expr &x, const z3::expr &y) const {
    Z3_ast r = Z3_mk_fpa_mul(ctx, roundingMode(), x, y);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::div(const z3::expr &x, const z3::expr &y) const {
    Z3_ast r = Z3_mk_fpa_div(ctx, roundingMode(), x, y);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::rem(const z3::expr &x, const z3::expr &y) const {
    Z3_ast r = Z3_mk_fpa_rem(ctx, x, y);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::isNaN(const z3::expr &x) const {
    return x.mk_is_nan();
}

z3::expr Z3Context::isInfinite(const z3::expr &x) const {
    return x.mk_is_inf();
}

z3::expr Z3Context::isZero(const z3::expr &x) const {
    return x.mk_is_zero();
}

z3::expr Z3Context::isNegative(const z3::expr &x) const {
    Z3_ast r = Z3_mk_fpa_is_negative(ctx, x);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::isPositive(const z3::expr &x) const {
    Z3_ast r = Z3_mk_fpa_is_positive(ctx, x);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::isNegativeZero(const z3::expr &x) const {
    return isZero(x) && isNegative(x);
}

z3::expr Z3Context::fpEq(const z3::expr &x, const z3::expr &y) const {
    return z3::fp_eq(x, y);
}

z3::expr Z3Context::fpLt(const z3::expr &x, const z3::expr &y) const {
    Z3_ast r = Z3_mk_fpa_lt(ctx, x, y);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::fpLe(const z3::expr &x, const z3::expr &y) const {
    Z3_ast r = Z3_mk_fpa_leq(ctx, x, y);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::fpGt(const z3::expr &x, const z3::expr &y) const {
    Z3_ast r = Z3_mk_fpa_gt(ctx, x, y);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::fpGe(const z3::expr &x, const z3::expr &y) const {
    Z3_ast r = Z3_mk_fpa_geq(ctx, x, y);
    ctx.check_error();
    return z3::expr(ctx, r);
}

z3::expr Z3Context::hasClass(const z3::expr &x, SymbolicFloat::Class cls) const {
    switch (cls) {
    case SymbolicFloat::PosZero: return isZero(x) && isPositive(x);
    case SymbolicFloat::NegZero: return isNegativeZero(x);
    case SymbolicFloat::PosInfinity: return isInfinite(x) && isPositive(x);
    case SymbolicFloat::NegInfinity: return isInfinite(x) && isNegative(x);
    case SymbolicFloat::NaN: return isNaN(x);
    case SymbolicFloat::Finite: return !isNaN(x) && !isInfinite(x) && !isZero(x);
    case SymbolicFloat::True: return x;
    case SymbolicFloat::False: return !x;
    }
    throw std::logic_error("unknown class");
}

z3::expr Z3Context::bTrue() const {
    return ctx.bool_val(true);
}

z3::expr Z3Context::bFalse() const {
    return ctx.bool_val(false);
}

z3::expr Z3Context::boolVal(bool value) const {
    return ctx.bool_val(value);
}

z3::expr Z3Context::floatVar(const std::string &basename, FloatType::Type type) {
    return ctx.constant(generateFreshName(basename).c_str(), floatSort(type));
}

z3::expr Z3Context::boolVar(const std::string &basename) {
    return ctx.bool_const(generateFreshName(basename).c_str());
}

SymbolicFloat Z3Context::toSymbolicFloat(const z3::expr &numeral) const {
    if (numeral.is_bool()) {
        if (numeral.is_true()) {
            return SymbolicFloat::boolean(true);
        } else if (numeral.is_false()) {
            return SymbolicFloat::boolean(false);
        }
    } else if (numeral.is_fpa() && Z3_is_numeral_ast(ctx, numeral)) {
        if (Z3_fpa_is_numeral_nan(ctx, numeral)) {
            return SymbolicFloat::nan();
        }
        bool negative = Z3_fpa_is_numeral_negative(ctx, numeral);
        if (Z3_fpa_is_numeral_inf(ctx, numeral)) {
            return SymbolicFloat::infinity(negative);
        }
        if (Z3_fpa_is_numeral_zero(ctx, numeral)) {
            return negative ? SymbolicFloat::negZero() : SymbolicFloat::posZero();
        }
        Z3_ast r = Z3_mk_fpa_to_real(ctx, numeral);
        ctx.check_error();
        z3::expr real = z3::expr(ctx, r).simplify();
        return SymbolicFloat::literal(real.as_double());
    }
    std::stringstream s;
    s << "not a numeral: " << numeral;
    throw NotConcrete(s.str());
}

std::string Z3Context::generateFreshName(const std::string &basename) {
    std::string newname = basename;

    while (usedNames.find(newname) != usedNames.end()) {
        int cnt = usedNames[basename]++;
        newname = basename + "_" + std::to_string(cnt);
    }

    usedNames.emplace(newname, 1); // newname is now used once
    return newname;
}
