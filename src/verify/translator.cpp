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

#include "translator.hpp"
#include "../config.hpp"
#include "../debug.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

using namespace std;


Translator::Translator(Z3Context &ctx, const Rule &rule, FloatType::Type type)
    : ctx(ctx), rule(rule), type(type), semantics(ctx, type) {
    declareInputs();
    matchFlags();
    src = encodeSide(rule.getLhs(), true);
    tgt = encodeSide(rule.getRhs(), false);
    pre = PreconditionEvaluator::encode(rule.getPrecondition(), *this);
    debugChecker("encoded " << rule.getName() << " for " << FloatType::name(type) << ": " << inputs.size() << " inputs, "
                 << matched.size() << " matched flags, " << srcChoices.size() << " source choices");
}

void Translator::declareInputs() {
    std::vector<Operand> free;
    for (const std::vector<Instruction> *side: {&rule.getLhs(), &rule.getRhs()}) {
        for (const Instruction &instr: *side) {
            for (const Operand &op: instr.getOperands()) {
                if (op.isFree() && std::find(free.begin(), free.end(), op) == free.end()) {
                    free.push_back(op);
                }
            }
        }
    }
    for (const Operand &op: free) {
        Input in(op, ctx.floatVar(op.getName(), type));
        if (op.isInput()) {
            if (Config::Verify::PoisonInputs) {
                in.poison = ctx.boolVar(op.getName() + "_poison");
            }
            if (Config::Verify::UndefInputs) {
                in.undef = ctx.boolVar(op.getName() + "_undef");
            }
        }
        inputs.push_back(in);
    }
}

void Translator::matchFlags() {
    std::vector<PredicateCall> calls;
    rule.getPrecondition()->collectPredicates(calls);
    for (const PredicateCall &call: calls) {
        if (!call.kind || call.args.size() != 1) {
            continue;
        }
        const Operand &arg = call.args.front();
        bool asksForFlag = PredicateCall::isFlagPredicate(call.kind.get()) || arg.isBinding();
        if (!asksForFlag || arg.isLiteral()) {
            continue;
        }
        option<Instruction> def = rule.lhsDefinition(arg.getName());
        if (!def) {
            // reported as unbound when the precondition is encoded
            continue;
        }
        FlagSet::Flag f = PredicateCall::flag(call.kind.get());
        if (def->getFlags().has(f)) {
            continue;
        }
        bool known = false;
        for (const MatchedFlag &m: matched) {
            known = known || (m.binding == arg.getName() && m.flag == f);
        }
        if (!known) {
            matched.emplace_back(arg.getName(), f, ctx.boolVar(FlagSet::name(f) + "_" + arg.getName()));
        }
    }
}

FlagTerms Translator::lhsFlags(const Instruction &instr) {
    std::vector<z3::expr> terms;
    for (FlagSet::Flag f: FlagSet::all) {
        z3::expr t = ctx.boolVal(instr.getFlags().has(f));
        for (const MatchedFlag &m: matched) {
            if (m.binding == instr.getResult() && m.flag == f) {
                t = m.value;
            }
        }
        terms.push_back(t);
    }
    return FlagTerms(terms[0], terms[1], terms[2]);
}

Term Translator::encodeOperand(const Operand &op, std::map<std::string, Term> &bindings, std::vector<z3::expr> &choices,
                               bool boolean) {
    switch (op.getKind()) {
    case Operand::Binding: {
        auto it = bindings.find(op.getName());
        if (it == bindings.end()) {
            throw MalformedRule(op.getName() + " is used before it is defined");
        }
        return it->second;
    }
    case Operand::Literal: {
        const SymbolicFloat &v = op.getValue();
        if (v.isPoison()) {
            return Term(boolean ? ctx.bFalse() : ctx.nan(type), ctx.bTrue());
        }
        if (v.isUndefined()) {
            z3::expr u = boolean || v.isBoolean() ? ctx.boolVar("undef") : ctx.floatVar("undef", type);
            choices.push_back(u);
            return Term(u, ctx.bFalse());
        }
        return Term(ctx.literal(v, type), ctx.bFalse());
    }
    default: {
        const Input &in = findInput(op.getName());
        z3::expr value = in.value;
        if (in.undef) {
            // every use of an undef input is a choice of its own
            z3::expr u = ctx.floatVar(op.getName() + "_choice", type);
            choices.push_back(u);
            inputChoices.push_back(u);
            value = z3::ite(in.undef.get(), u, in.value);
        }
        return Term(value, in.poison ? in.poison.get() : ctx.bFalse());
    }
    }
}

Term Translator::encodeSide(const std::vector<Instruction> &side, bool isLhs) {
    std::map<std::string, Term> bindings;
    std::vector<z3::expr> &choices = isLhs ? srcChoices : tgtChoices;
    for (const Instruction &instr: side) {
        bool boolean = instr.isUntyped() && rule.isBoolean(side, instr.getResult());
        std::vector<Term> operands;
        for (const Operand &op: instr.getOperands()) {
            operands.push_back(encodeOperand(op, bindings, choices, boolean));
        }
        FlagTerms flags = isLhs ? lhsFlags(instr) : FlagTerms::of(ctx, instr.getFlags());
        Term res = semantics.encode(instr.getOpcode(), instr.getPredicate(), operands, flags, choices);
        auto it = bindings.find(instr.getResult());
        if (it != bindings.end()) {
            throw MalformedRule(instr.getResult() + " is defined twice");
        }
        bindings.emplace(instr.getResult(), res);
    }
    return bindings.at(side.back().getResult());
}

const Translator::Input& Translator::findInput(const std::string &name) const {
    for (const Input &in: inputs) {
        if (in.operand.getName() == name) {
            return in;
        }
    }
    throw UnboundName(name + " does not occur in the rule");
}


Z3Context& Translator::context() {
    return ctx;
}

Term Translator::operand(const Operand &op) {
    switch (op.getKind()) {
    case Operand::Binding: {
        std::stringstream s;
        s << "the precondition cannot compare the instruction result " << op;
        throw MalformedRule(s.str());
    }
    case Operand::Literal: {
        const SymbolicFloat &v = op.getValue();
        if (v.isPoison() || v.isUndefined()) {
            return Term(ctx.nan(type), ctx.bTrue());
        }
        return Term(ctx.literal(v, type), ctx.bFalse());
    }
    default: {
        const Input &in = findInput(op.getName());
        z3::expr poison = ctx.bFalse();
        if (in.poison) {
            poison = poison || in.poison.get();
        }
        if (in.undef) {
            poison = poison || in.undef.get();
        }
        return Term(in.value, poison.simplify());
    }
    }
}

z3::expr Translator::flag(const std::string &binding, FlagSet::Flag flag) {
    option<Instruction> def = rule.lhsDefinition(binding);
    if (!def) {
        throw UnboundName("no instruction of the source defines " + binding);
    }
    if (def->getFlags().has(flag)) {
        return ctx.bTrue();
    }
    for (const MatchedFlag &m: matched) {
        if (m.binding == binding && m.flag == flag) {
            return m.value;
        }
    }
    throw std::logic_error("flag " + FlagSet::name(flag) + " of " + binding + " was not matched");
}

z3::expr Translator::cannotBeNegativeZero(const Operand &op) {
    for (const auto &p: analyses) {
        if (p.first == op) {
            return p.second;
        }
    }
    const Input &in = findInput(op.getName());
    z3::expr answer = ctx.boolVar("nonnegzero_" + op.getName());
    z3::expr holds = !ctx.isNegativeZero(in.value);
    if (in.undef) {
        holds = holds && !in.undef.get();
    }
    constraintList.push_back(z3::implies(answer, holds));
    analyses.emplace_back(op, answer);
    return answer;
}


FloatType::Type Translator::getType() const {
    return type;
}

const z3::expr& Translator::precondition() const {
    return pre.get();
}

const std::vector<z3::expr>& Translator::constraints() const {
    return constraintList;
}

const Term& Translator::source() const {
    return src.get();
}

const Term& Translator::target() const {
    return tgt.get();
}

bool Translator::isInputChoice(const z3::expr &choice) const {
    for (const z3::expr &c: inputChoices) {
        if (z3::eq(c, choice)) {
            return true;
        }
    }
    return false;
}

z3::expr Translator::eliminateChoices(const z3::expr &body, const std::vector<z3::expr> &choices) const {
    if (choices.empty()) {
        return body;
    }
    z3::context &z3Ctx = ctx.getContext();
    bool onlyBool = true;
    for (const z3::expr &c: choices) {
        onlyBool = onlyBool && c.is_bool();
    }
    if (!onlyBool || choices.size() > Config::Smt::MaxExpandedChoices) {
        z3::expr_vector vars(z3Ctx);
        for (const z3::expr &c: choices) {
            vars.push_back(c);
        }
        return z3::forall(vars, body);
    }

    // each assignment of the choices is one conjunct
    z3::expr_vector conjuncts(z3Ctx);
    for (unsigned long mask = 0; mask < (1ul << choices.size()); ++mask) {
        z3::expr_vector from(z3Ctx);
        z3::expr_vector to(z3Ctx);
        for (size_t i = 0; i < choices.size(); ++i) {
            from.push_back(choices[i]);
            to.push_back(ctx.boolVal((mask >> i) & 1));
        }
        z3::expr instance = body;
        conjuncts.push_back(instance.substitute(from, to));
    }
    return z3::mk_and(conjuncts);
}

z3::expr Translator::refinementQuery(bool definedInputs) const {
    const Term &s = source();
    const Term &t = target();
    z3::expr body = !s.poison && (t.poison || s.value != t.value);

    std::vector<z3::expr> quantified;
    for (const z3::expr &c: srcChoices) {
        if (!definedInputs || !isInputChoice(c)) {
            quantified.push_back(c);
        }
    }

    z3::context &z3Ctx = ctx.getContext();
    z3::expr_vector conjuncts(z3Ctx);
    conjuncts.push_back(precondition());
    for (const z3::expr &c: constraintList) {
        conjuncts.push_back(c);
    }
    conjuncts.push_back(eliminateChoices(body, quantified));
    z3::expr res = z3::mk_and(conjuncts);
    if (!definedInputs) {
        return res;
    }

    // the choices of undef inputs are still there, but never taken
    z3::expr_vector markers(z3Ctx);
    z3::expr_vector falses(z3Ctx);
    for (const Input &in: inputs) {
        for (const option<z3::expr> &m: {in.poison, in.undef}) {
            if (m) {
                markers.push_back(m.get());
                falses.push_back(ctx.bFalse());
            }
        }
    }
    return res.substitute(markers, falses);
}

z3::expr Translator::definedInputs() const {
    z3::expr_vector conjuncts(ctx.getContext());
    for (const Input &in: inputs) {
        if (in.poison) {
            conjuncts.push_back(!in.poison.get());
        }
        if (in.undef) {
            conjuncts.push_back(!in.undef.get());
        }
    }
    return z3::mk_and(conjuncts);
}

bool Translator::hasMarkers() const {
    for (const Input &in: inputs) {
        if (in.poison || in.undef) {
            return true;
        }
    }
    return false;
}

const std::vector<Translator::Input>& Translator::getInputs() const {
    return inputs;
}

const std::vector<Translator::MatchedFlag>& Translator::getMatchedFlags() const {
    return matched;
}

const std::vector<std::pair<Operand, z3::expr>>& Translator::getAnalyses() const {
    return analyses;
}
