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

#include "instruction.hpp"

using namespace std;

Instruction::Instruction(const std::string &result, Op::Opcode op, const std::vector<Operand> &operands,
                         const FlagSet &flags, const option<FloatType::Type> &type)
    : result(result), op(op), pred(Op::PredFalse), operands(operands), flags(flags), type(type) {}

Instruction Instruction::compare(const std::string &result, Op::Predicate pred, const std::vector<Operand> &operands,
                                 const FlagSet &flags, const option<FloatType::Type> &type) {
    Instruction res(result, Op::FCmp, operands, flags, type);
    res.pred = pred;
    return res;
}

Instruction Instruction::copy(const std::string &result, const Operand &operand) {
    return Instruction(result, Op::Copy, {operand});
}

const std::string& Instruction::getResult() const {
    return result;
}

Op::Opcode Instruction::getOpcode() const {
    return op;
}

Op::Predicate Instruction::getPredicate() const {
    return pred;
}

const std::vector<Operand>& Instruction::getOperands() const {
    return operands;
}

const FlagSet& Instruction::getFlags() const {
    return flags;
}

const option<FloatType::Type>& Instruction::getType() const {
    return type;
}

bool Instruction::isBoolean() const {
    if (op == Op::Copy) {
        const Operand &arg = operands.front();
        return arg.isLiteral() && arg.getValue().isBoolean();
    }
    return Op::isBoolean(op);
}

bool Instruction::isUntyped() const {
    if (op != Op::Copy || !operands.front().isLiteral()) {
        return false;
    }
    const SymbolicFloat &v = operands.front().getValue();
    return v.isPoison() || (v.isUndefined() && v.possibleClasses() == SymbolicFloat::FloatClasses);
}

Instruction Instruction::withFlags(const FlagSet &flags) const {
    Instruction res = *this;
    res.flags = flags;
    return res;
}

std::ostream& operator<<(std::ostream &s, const Instruction &instr) {
    s << instr.result << " = ";
    if (instr.op != Op::Copy) {
        s << Op::name(instr.op) << " ";
        if (!instr.flags.empty()) {
            s << instr.flags << " ";
        }
        if (instr.op == Op::FCmp) {
            s << Op::name(instr.pred) << " ";
        }
        if (instr.type) {
            s << FloatType::name(instr.type.get()) << " ";
        }
    }
    for (size_t i = 0; i < instr.operands.size(); ++i) {
        if (i > 0) s << ", ";
        s << instr.operands[i];
    }
    return s;
}
