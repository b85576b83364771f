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

#ifndef FPRV_INSTRUCTION_HPP
#define FPRV_INSTRUCTION_HPP

#include <ostream>
#include <string>
#include <vector>

#include "operand.hpp"
#include "../semantics/flags.hpp"
#include "../semantics/opcode.hpp"
#include "../util/option.hpp"
#include "../value/floattype.hpp"

/**
 * One instruction of a rule, e.g., %r = fadd nsz %x, 0.0
 *
 * The copy form %r = %x has the opcode Copy and a single operand.
 */
class Instruction {
public:
    Instruction(const std::string &result, Op::Opcode op, const std::vector<Operand> &operands,
                const FlagSet &flags = FlagSet(), const option<FloatType::Type> &type = {});

    static Instruction compare(const std::string &result, Op::Predicate pred, const std::vector<Operand> &operands,
                               const FlagSet &flags = FlagSet(), const option<FloatType::Type> &type = {});

    static Instruction copy(const std::string &result, const Operand &operand);

    const std::string& getResult() const;
    Op::Opcode getOpcode() const;
    Op::Predicate getPredicate() const;
    const std::vector<Operand>& getOperands() const;
    const FlagSet& getFlags() const;

    // the floating-point type written in the instruction, if any
    const option<FloatType::Type>& getType() const;

    // whether the result is a one-bit value, copies of bindings are resolved by the rule
    bool isBoolean() const;

    // a copy of poison or undef, which fits either type
    bool isUntyped() const;

    Instruction withFlags(const FlagSet &flags) const;

    friend std::ostream& operator<<(std::ostream &s, const Instruction &instr);

private:
    std::string result;
    Op::Opcode op;
    Op::Predicate pred;
    std::vector<Operand> operands;
    FlagSet flags;
    option<FloatType::Type> type;
};

#endif // FPRV_INSTRUCTION_HPP
