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

#include "semantics.hpp"
#include "../smt/z3/z3.hpp"
#include "../config.hpp"
#include "../debug.hpp"

#include <sstream>
#include <stdexcept>

using namespace std;


FlagTerms FlagTerms::of(const Z3Context &ctx, const FlagSet &flags) {
    return FlagTerms(ctx.boolVal(flags.has(FlagSet::NoNaNs)),
                     ctx.boolVal(flags.has(FlagSet::NoInfs)),
                     ctx.boolVal(flags.has(FlagSet::NoSignedZeros)));
}


Semantics::Semantics(Z3Context &ctx, FloatType::Type type): ctx(ctx), type(type) {}

Term Semantics::encode(Op::Opcode op, Op::Predicate pred, const std::vector<Term> &operands, const FlagTerms &flags,
                       std::vector<z3::expr> &choices) {
    if (operands.size() != Op::arity(op)) {
        throw std::invalid_argument(Op::name(op) + " expects " + to_string(Op::arity(op)) + " operands");
    }
    switch (op) {
    case Op::Copy:
        return operands[0];
    case Op::FCmp:
        return compare(pred, operands[0], operands[1], flags);
    default:
        return arithmetic(op, operands[0], operands[1], flags, choices);
    }
}

Term Semantics::arithmetic(Op::Opcode op, const Term &x, const Term &y, const FlagTerms &flags,
                           std::vector<z3::expr> &choices) {
    z3::expr res = ctx.bFalse();
    switch (op) {
    case Op::FAdd: res = ctx.add(x.value, y.value); break;
    case Op::FSub: res = ctx.sub(x.value, y.value); break;
    case Op::FMul: res = ctx.mul(x.value, y.value); break;
    case Op::FDiv: res = ctx.div(x.value, y.value); break;
    case Op::FRem: res = ctx.rem(x.value, y.value); break;
    default: throw std::invalid_argument(Op::name(op) + " is not an arithmetic instruction");
    }

    const Config::FastMath::Encoding encoding = Config::FastMath::Semantics;
    z3::expr poison = x.poison || y.poison;
    z3::expr violated = ctx.bFalse();
    bool mayViolate = false;
    if (!flags.nnan.is_false()) {
        violated = violated || (flags.nnan && (ctx.isNaN(x.value) || ctx.isNaN(y.value) || ctx.isNaN(res)));
        mayViolate = true;
    }
    if (!flags.ninf.is_false()) {
        violated = violated || (flags.ninf && (ctx.isInfinite(x.value) || ctx.isInfinite(y.value) || ctx.isInfinite(res)));
        mayViolate = true;
    }

    z3::expr value = res;
    if (!flags.nsz.is_false()) {
        switch (encoding) {
        case Config::FastMath::OldNSZ:
            violated = violated || (flags.nsz && (ctx.isNegativeZero(x.value) || ctx.isNegativeZero(y.value)));
            mayViolate = true;
            break;
        case Config::FastMath::BrokenNSZ: {
            z3::expr q = ctx.floatVar("nsz", type);
            choices.push_back(q);
            z3::expr replaced = flags.nsz && ctx.isZero(res);
            value = z3::ite(replaced, q, res);
            poison = poison || (replaced && !ctx.isZero(q));
            break;
        }
        case Config::FastMath::Poison:
        case Config::FastMath::Undef: {
            // every instruction picks the sign of its zero result on its own
            z3::expr positive = ctx.boolVar("nsz");
            choices.push_back(positive);
            z3::expr zero = z3::ite(positive, ctx.zero(type, false), ctx.zero(type, true));
            value = z3::ite(flags.nsz && ctx.isZero(res), zero, res);
            break;
        }
        }
    }

    if (!mayViolate) {
        return Term(value, poison);
    }
    if (encoding == Config::FastMath::Undef) {
        z3::expr u = ctx.floatVar("undef", type);
        choices.push_back(u);
        return Term(z3::ite(violated, u, value), poison);
    }
    return Term(value, poison || violated);
}

Term Semantics::compare(Op::Predicate pred, const Term &x, const Term &y, const FlagTerms &flags) {
    const z3::expr &a = x.value;
    const z3::expr &b = y.value;
    z3::expr unordered = ctx.isNaN(a) || ctx.isNaN(b);

    z3::expr res = ctx.bFalse();
    switch (pred) {
    case Op::PredFalse: res = ctx.bFalse(); break;
    case Op::OEQ: res = ctx.fpEq(a, b); break;
    case Op::OGT: res = ctx.fpGt(a, b); break;
    case Op::OGE: res = ctx.fpGe(a, b); break;
    case Op::OLT: res = ctx.fpLt(a, b); break;
    case Op::OLE: res = ctx.fpLe(a, b); break;
    case Op::ONE: res = !unordered && !ctx.fpEq(a, b); break;
    case Op::ORD: res = !unordered; break;
    case Op::UEQ: res = unordered || ctx.fpEq(a, b); break;
    case Op::UGT: res = unordered || ctx.fpGt(a, b); break;
    case Op::UGE: res = unordered || ctx.fpGe(a, b); break;
    case Op::ULT: res = unordered || ctx.fpLt(a, b); break;
    case Op::ULE: res = unordered || ctx.fpLe(a, b); break;
    case Op::UNE: res = unordered || !ctx.fpEq(a, b); break;
    case Op::UNO: res = unordered; break;
    case Op::PredTrue: res = ctx.bTrue(); break;
    }

    z3::expr poison = x.poison || y.poison;
    if (!flags.nnan.is_false()) {
        poison = poison || (flags.nnan && unordered);
    }
    if (!flags.ninf.is_false()) {
        poison = poison || (flags.ninf && (ctx.isInfinite(a) || ctx.isInfinite(b)));
    }
    return Term(res, poison);
}

SymbolicFloat Semantics::evaluate(Op::Opcode op, const std::vector<SymbolicFloat> &operands, const FlagSet &flags,
                                  FloatType::Type type) {
    if (op == Op::FCmp) {
        throw std::invalid_argument("fcmp needs a predicate");
    }
    return evaluate(op, Op::PredFalse, operands, flags, type);
}

SymbolicFloat Semantics::evaluate(Op::Predicate pred, const std::vector<SymbolicFloat> &operands, const FlagSet &flags,
                                  FloatType::Type type) {
    return evaluate(Op::FCmp, pred, operands, flags, type);
}

SymbolicFloat Semantics::evaluate(Op::Opcode op, Op::Predicate pred, const std::vector<SymbolicFloat> &operands,
                                  const FlagSet &flags, FloatType::Type type) {
    if (operands.size() != Op::arity(op)) {
        throw std::invalid_argument(Op::name(op) + " expects " + to_string(Op::arity(op)) + " operands");
    }
    z3::context z3Ctx;
    Z3Context ctx(z3Ctx);
    Semantics semantics(ctx, type);

    std::vector<Term> terms;
    std::vector<z3::expr> constraints;
    for (const SymbolicFloat &v: operands) {
        if (v.isVariable()) {
            throw NotConcrete("cannot evaluate " + Op::name(op) + " on variable " + v.getName());
        }
        if (op != Op::Copy && v.isBoolean()) {
            throw std::invalid_argument(Op::name(op) + " expects floating-point operands");
        }
        switch (v.getKind()) {
        case SymbolicFloat::Poison:
            terms.emplace_back(ctx.nan(type), ctx.bTrue());
            break;
        case SymbolicFloat::Literal:
            terms.emplace_back(ctx.literal(v, type), ctx.bFalse());
            break;
        case SymbolicFloat::Undefined: {
            z3::expr u = v.isBoolean() ? ctx.boolVar("undef") : ctx.floatVar("undef", type);
            z3::expr_vector alternatives(z3Ctx);
            for (SymbolicFloat::Class cls: v.possibleClasses()) {
                alternatives.push_back(ctx.hasClass(u, cls));
            }
            constraints.push_back(z3::mk_or(alternatives));
            terms.emplace_back(u, ctx.bFalse());
            break;
        }
        case SymbolicFloat::Variable:
            break;
        }
    }

    std::vector<z3::expr> choices;
    Term res = semantics.encode(op, pred, terms, FlagTerms::of(ctx, flags), choices);
    bool isBool = Op::isBoolean(op) || (op == Op::Copy && operands[0].isBoolean());
    SymbolicFloat value = concretize(ctx, res, constraints, isBool);
    debugSemantics(Op::name(op) << " " << flags << " on " << operands.size() << " operands in " << FloatType::name(type) << ": " << value);
    return value;
}

static Smt::Result checkOrThrow(Z3 &solver) {
    Smt::Result res = solver.check();
    if (res == Smt::Unknown) {
        throw SolverUnknown("z3 returned unknown: " + solver.reasonUnknown());
    }
    return res;
}

SymbolicFloat Semantics::concretize(Z3Context &ctx, const Term &term, const std::vector<z3::expr> &constraints, bool isBool) {
    Z3 solver(ctx.getContext(), Config::Smt::EvaluationTimeout);
    solver.enableModels();
    for (const z3::expr &c: constraints) {
        solver.add(c);
    }

    solver.push();
    solver.add(term.poison);
    if (checkOrThrow(solver) == Smt::Sat) {
        return SymbolicFloat::poison();
    }
    solver.pop();
    solver.add(!term.poison);

    SymbolicFloat::ClassSet possible;
    for (SymbolicFloat::Class cls: isBool ? SymbolicFloat::BoolClasses : SymbolicFloat::FloatClasses) {
        solver.push();
        solver.add(ctx.hasClass(term.value, cls));
        if (checkOrThrow(solver) == Smt::Sat) {
            possible.insert(cls);
        }
        solver.pop();
    }
    if (possible.empty()) {
        throw std::logic_error("the constraints of a concrete evaluation are unsatisfiable");
    }
    if (possible.size() > 1) {
        return SymbolicFloat::undefined(possible);
    }

    SymbolicFloat::Class cls = *possible.begin();
    if (cls != SymbolicFloat::Finite) {
        return SymbolicFloat::ofClass(cls);
    }

    // a finite result is concrete if the first value we find is the only one
    solver.push();
    solver.add(ctx.hasClass(term.value, cls));
    checkOrThrow(solver);
    z3::expr numeral = solver.model().eval(term.value, true).simplify();
    solver.pop();
    solver.push();
    solver.add(term.value != numeral);
    Smt::Result unique = checkOrThrow(solver);
    solver.pop();
    if (unique == Smt::Sat) {
        return SymbolicFloat::undefined(possible);
    }
    return ctx.toSymbolicFloat(numeral);
}
