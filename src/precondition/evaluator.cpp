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

#include "evaluator.hpp"

#include <sstream>

using namespace std;

PreconditionEnvironment::~PreconditionEnvironment() {}

namespace PreconditionEvaluator {

    static bool mayBeNegativeZero(const SymbolicFloat &v) {
        return !v.isLiteral() || isSignedZero(v);
    }

    static std::string str(const Precondition &pre) {
        std::stringstream s;
        s << pre;
        return s.str();
    }

    void check(const Precondition &pre) {
        std::vector<PredicateCall> calls;
        pre->collectPredicates(calls);
        for (const PredicateCall &call: calls) {
            if (!call.kind) {
                throw MalformedRule("unknown predicate " + call.name);
            }
            if (call.args.size() != 1) {
                throw MalformedRule(call.name + " expects exactly one argument");
            }
            if (PredicateCall::isFlagPredicate(call.kind.get()) && call.args.front().isLiteral()) {
                throw MalformedRule(call.name + " expects the result of an instruction");
            }
        }
    }

    static z3::expr encodeComparison(const Comparison &cmp, PreconditionEnvironment &env) {
        Z3Context &ctx = env.context();
        Term a = env.operand(cmp.lhs);
        Term b = env.operand(cmp.rhs);
        z3::expr defined = !a.poison && !b.poison;
        if (a.value.is_bool() != b.value.is_bool()) {
            std::stringstream s;
            s << "cannot compare " << cmp.lhs << " and " << cmp.rhs;
            throw MalformedRule(s.str());
        }
        if (a.value.is_bool()) {
            switch (cmp.rel) {
            case Comparison::Eq: return defined && a.value == b.value;
            case Comparison::Neq: return defined && a.value != b.value;
            default: throw MalformedRule("one-bit values can only be compared with == and !=");
            }
        }
        switch (cmp.rel) {
        case Comparison::Eq: return defined && ctx.fpEq(a.value, b.value);
        case Comparison::Neq: return defined && !ctx.fpEq(a.value, b.value);
        case Comparison::Lt: return defined && ctx.fpLt(a.value, b.value);
        case Comparison::Le: return defined && ctx.fpLe(a.value, b.value);
        case Comparison::Gt: return defined && ctx.fpGt(a.value, b.value);
        case Comparison::Ge: return defined && ctx.fpGe(a.value, b.value);
        }
        throw std::logic_error("unknown relation");
    }

    static z3::expr encodePredicate(const PredicateCall &call, PreconditionEnvironment &env) {
        Z3Context &ctx = env.context();
        const Operand &arg = call.args.front();
        if (PredicateCall::isFlagPredicate(call.kind.get())) {
            return env.flag(arg.getName(), PredicateCall::flag(call.kind.get()));
        }
        switch (arg.getKind()) {
        case Operand::Literal:
            return ctx.boolVal(!mayBeNegativeZero(arg.getValue()));
        case Operand::Binding:
            return env.flag(arg.getName(), FlagSet::NoSignedZeros);
        default:
            return env.cannotBeNegativeZero(arg);
        }
    }

    z3::expr encode(const Precondition &pre, PreconditionEnvironment &env) {
        Z3Context &ctx = env.context();
        option<bool> c = pre->getConst();
        if (c) {
            return ctx.boolVal(c.get());
        }
        option<PredicateCall> call = pre->getPredicate();
        if (call) {
            check(pre);
            return encodePredicate(call.get(), env);
        }
        option<Comparison> cmp = pre->getComparison();
        if (cmp) {
            return encodeComparison(cmp.get(), env);
        }
        std::vector<Precondition> children = pre->getChildren();
        if (pre->isNot()) {
            return !encode(children.front(), env);
        }
        z3::expr_vector args(ctx.getContext());
        for (const Precondition &child: children) {
            args.push_back(encode(child, env));
        }
        if (pre->isAnd()) {
            return z3::mk_and(args);
        } else if (pre->isOr()) {
            return z3::mk_or(args);
        }
        throw std::logic_error("unknown precondition " + str(pre));
    }


    static const SymbolicFloat& valueOf(const Operand &op, const Assignment &assignment) {
        if (op.isLiteral()) {
            return op.getValue();
        }
        auto it = assignment.values.find(op.getName());
        if (it == assignment.values.end()) {
            throw UnboundName("no value for " + op.getName());
        }
        return it->second;
    }

    static const FlagSet& flagsOf(const std::string &binding, const Assignment &assignment) {
        auto it = assignment.flags.find(binding);
        if (it == assignment.flags.end()) {
            throw UnboundName("no instruction defines " + binding);
        }
        return it->second;
    }

    static bool evaluateComparison(const Comparison &cmp, const Assignment &assignment) {
        const SymbolicFloat &a = valueOf(cmp.lhs, assignment);
        const SymbolicFloat &b = valueOf(cmp.rhs, assignment);
        if (a.isBoolean() != b.isBoolean()) {
            std::stringstream s;
            s << "cannot compare " << cmp.lhs << " and " << cmp.rhs;
            throw MalformedRule(s.str());
        }
        if (!a.isLiteral() || !b.isLiteral()) {
            return false;
        }
        if (a.isBoolean()) {
            switch (cmp.rel) {
            case Comparison::Eq: return classify(a) == classify(b);
            case Comparison::Neq: return classify(a) != classify(b);
            default: throw MalformedRule("one-bit values can only be compared with == and !=");
            }
        }
        double x = a.getValue().get();
        double y = b.getValue().get();
        switch (cmp.rel) {
        case Comparison::Eq: return x == y;
        case Comparison::Neq: return !(x == y);
        case Comparison::Lt: return x < y;
        case Comparison::Le: return x <= y;
        case Comparison::Gt: return x > y;
        case Comparison::Ge: return x >= y;
        }
        throw std::logic_error("unknown relation");
    }

    static bool evaluatePredicate(const PredicateCall &call, const Assignment &assignment) {
        const Operand &arg = call.args.front();
        if (PredicateCall::isFlagPredicate(call.kind.get())) {
            return flagsOf(arg.getName(), assignment).has(PredicateCall::flag(call.kind.get()));
        }
        switch (arg.getKind()) {
        case Operand::Literal:
            return !mayBeNegativeZero(arg.getValue());
        case Operand::Binding:
            return flagsOf(arg.getName(), assignment).has(FlagSet::NoSignedZeros);
        default:
            return assignment.notNegativeZero.count(arg.getName()) > 0
                    && !mayBeNegativeZero(valueOf(arg, assignment));
        }
    }

    bool evaluate(const Precondition &pre, const Assignment &assignment) {
        option<bool> c = pre->getConst();
        if (c) {
            return c.get();
        }
        option<PredicateCall> call = pre->getPredicate();
        if (call) {
            check(pre);
            return evaluatePredicate(call.get(), assignment);
        }
        option<Comparison> cmp = pre->getComparison();
        if (cmp) {
            return evaluateComparison(cmp.get(), assignment);
        }
        std::vector<Precondition> children = pre->getChildren();
        if (pre->isNot()) {
            return !evaluate(children.front(), assignment);
        }
        if (pre->isAnd()) {
            for (const Precondition &child: children) {
                if (!evaluate(child, assignment)) {
                    return false;
                }
            }
            return true;
        }
        if (pre->isOr()) {
            for (const Precondition &child: children) {
                if (evaluate(child, assignment)) {
                    return true;
                }
            }
            return false;
        }
        throw std::logic_error("unknown precondition " + str(pre));
    }

}
