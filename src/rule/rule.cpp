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

#include "rule.hpp"
#include "../precondition/evaluator.hpp"

#include <algorithm>
#include <set>
#include <sstream>

using namespace std;

Rule::Rule(const std::string &name, const Precondition &pre, const std::vector<Instruction> &lhs,
           const std::vector<Instruction> &rhs, bool bidirectional, const option<FloatType::Type> &type)
    : name(name), pre(pre), lhs(lhs), rhs(rhs), bidirectional(bidirectional), type(type) {}

Rule Rule::malformed(const std::string &name, const std::string &reason) {
    Rule res(name, Pre::True, {}, {});
    res.malformedReason = reason;
    return res;
}

const std::string& Rule::getName() const {
    return name;
}

const Precondition& Rule::getPrecondition() const {
    return pre;
}

const std::vector<Instruction>& Rule::getLhs() const {
    return lhs;
}

const std::vector<Instruction>& Rule::getRhs() const {
    return rhs;
}

const Instruction& Rule::lhsRoot() const {
    if (lhs.empty()) {
        throw MalformedRule("the lhs of " + name + " is empty");
    }
    return lhs.back();
}

const Instruction& Rule::rhsRoot() const {
    if (rhs.empty()) {
        throw MalformedRule("the rhs of " + name + " is empty");
    }
    return rhs.back();
}

bool Rule::isBidirectional() const {
    return bidirectional;
}

const option<FloatType::Type>& Rule::getType() const {
    return type;
}

bool Rule::isActive() const {
    return active;
}

const std::string& Rule::getReason() const {
    return reason;
}

bool Rule::isMalformed() const {
    return static_cast<bool>(malformedReason);
}

option<FloatType::Type> Rule::pinnedType() const {
    option<FloatType::Type> res = type;
    for (const std::vector<Instruction> *side: {&lhs, &rhs}) {
        for (const Instruction &instr: *side) {
            if (!instr.getType()) {
                continue;
            }
            if (res && res.get() != instr.getType().get()) {
                throw MalformedRule("conflicting types " + FloatType::name(res.get()) + " and "
                                    + FloatType::name(instr.getType().get()));
            }
            res = instr.getType();
        }
    }
    return res;
}

std::vector<Operand> Rule::freeVariables() const {
    std::vector<Operand> res;
    for (const Instruction &instr: lhs) {
        for (const Operand &op: instr.getOperands()) {
            if (op.isFree() && std::find(res.begin(), res.end(), op) == res.end()) {
                res.push_back(op);
            }
        }
    }
    return res;
}

option<Instruction> Rule::lhsDefinition(const std::string &binding) const {
    for (const Instruction &instr: lhs) {
        if (instr.getResult() == binding) {
            return instr;
        }
    }
    return {};
}

option<bool> Rule::resultType(const std::vector<Instruction> &side, const std::string &binding) const {
    for (auto it = side.rbegin(); it != side.rend(); ++it) {
        if (it->getResult() != binding) {
            continue;
        }
        if (it->getOpcode() == Op::Copy && it->getOperands().front().isBinding()) {
            return resultType(side, it->getOperands().front().getName());
        }
        if (it->isUntyped()) {
            return {};
        }
        return it->isBoolean();
    }
    return false;
}

bool Rule::aliasesRoot(const std::vector<Instruction> &side, const std::string &binding) const {
    std::string name = side.back().getResult();
    while (name != binding) {
        auto it = std::find_if(side.rbegin(), side.rend(), [&](const Instruction &instr) {
            return instr.getResult() == name;
        });
        if (it == side.rend() || it->getOpcode() != Op::Copy || !it->getOperands().front().isBinding()) {
            return false;
        }
        name = it->getOperands().front().getName();
    }
    return true;
}

bool Rule::isBoolean(const std::vector<Instruction> &side, const std::string &binding) const {
    option<bool> res = resultType(side, binding);
    if (res) {
        return res.get();
    }
    // poison and undef results take the type of the other side
    if (side.empty() || !aliasesRoot(side, binding)) {
        return false;
    }
    const std::vector<Instruction> &other = &side == &lhs ? rhs : lhs;
    if (other.empty()) {
        return false;
    }
    option<bool> otherRes = resultType(other, other.back().getResult());
    return otherRes && otherRes.get();
}

void Rule::validateSide(const std::vector<Instruction> &side, bool isLhs) const {
    std::set<std::string> lhsFree;
    for (const Operand &op: freeVariables()) {
        lhsFree.insert(op.getName());
    }
    std::set<std::string> defined;
    for (const Instruction &instr: side) {
        Op::Opcode op = instr.getOpcode();
        if (instr.getOperands().size() != Op::arity(op)) {
            throw MalformedRule(Op::name(op) + " expects " + to_string(Op::arity(op)) + " operands");
        }
        if (op == Op::Copy && !instr.getFlags().empty()) {
            throw MalformedRule("a copy cannot have flags");
        }
        for (const Operand &arg: instr.getOperands()) {
            bool boolean = false;
            if (arg.isBinding()) {
                if (defined.count(arg.getName()) == 0) {
                    throw MalformedRule("unbound " + arg.getName());
                }
                boolean = isBoolean(side, arg.getName());
            } else if (arg.isFree()) {
                if (!isLhs && lhsFree.count(arg.getName()) == 0) {
                    throw MalformedRule("unbound " + arg.getName() + " in the rhs");
                }
            } else {
                boolean = arg.getValue().isBoolean();
            }
            if (boolean && op != Op::Copy) {
                throw MalformedRule(Op::name(op) + " expects floating-point operands");
            }
        }
        const std::string &result = instr.getResult();
        if (defined.count(result) > 0 || lhsFree.count(result) > 0) {
            throw MalformedRule("redefinition of " + result);
        }
        defined.insert(result);
    }
}

void Rule::validate() const {
    if (malformedReason) {
        throw MalformedRule(malformedReason.get());
    }
    if (lhs.empty() || rhs.empty()) {
        throw MalformedRule("both sides need at least one instruction");
    }
    validateSide(lhs, true);
    validateSide(rhs, false);
    const std::string &root = lhsRoot().getResult();
    if (rhsRoot().getResult() != root) {
        throw MalformedRule("the rhs has to define " + root);
    }
    if (isBoolean(lhs, root) != isBoolean(rhs, root)) {
        throw MalformedRule("the results of lhs and rhs have different types");
    }
    PreconditionEvaluator::check(pre);
    pinnedType();
}

Rule Rule::disable(const std::string &reason) const {
    Rule res = *this;
    res.active = false;
    res.reason = reason;
    return res;
}

Rule Rule::enable() const {
    Rule res = *this;
    res.active = true;
    res.reason.clear();
    return res;
}

Rule Rule::withPrecondition(const Precondition &pre) const {
    Rule res = *this;
    res.pre = pre;
    return res;
}

Rule Rule::withoutFlag(size_t lhsIndex, FlagSet::Flag flag) const {
    Rule res = *this;
    Instruction &instr = res.lhs.at(lhsIndex);
    instr = instr.withFlags(instr.getFlags().without(flag));
    return res;
}

Rule Rule::reversed() const {
    Rule res = *this;
    std::swap(res.lhs, res.rhs);
    return res;
}

std::ostream& operator<<(std::ostream &s, const Rule &rule) {
    std::vector<std::string> lines;
    std::stringstream line;
    lines.push_back("Name: " + rule.name);
    if (rule.malformedReason) {
        lines.push_back("; Malformed: " + rule.malformedReason.get());
    } else {
        if (rule.type) {
            lines.push_back("Type: " + FloatType::name(rule.type.get()));
        }
        if (!Pre::isTrue(rule.pre)) {
            line << "Pre: " << rule.pre;
            lines.push_back(line.str());
        }
        for (const Instruction &instr: rule.lhs) {
            line.str("");
            line << instr;
            lines.push_back(line.str());
        }
        lines.push_back(rule.bidirectional ? "  <=>" : "  =>");
        for (const Instruction &instr: rule.rhs) {
            line.str("");
            line << instr;
            lines.push_back(line.str());
        }
    }

    if (!rule.active) {
        s << "; Disabled: " << rule.reason << std::endl;
    }
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) s << std::endl;
        if (!rule.active) s << "; ";
        s << lines[i];
    }
    return s;
}
