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

#include "interpreter.hpp"
#include "../semantics/semantics.hpp"
#include "../debug.hpp"

using namespace std;

Interpreter::Interpreter(FloatType::Type type): type(type) {}

void Interpreter::assign(const std::string &name, const SymbolicFloat &value) {
    values.erase(name);
    values.emplace(name, value);
}

void Interpreter::addFlag(const std::string &binding, FlagSet::Flag flag) {
    extraFlags[binding] = extraFlags[binding].with(flag);
}

SymbolicFloat Interpreter::run(const std::vector<Instruction> &side, bool isLhs, bool boolean) const {
    std::map<std::string, SymbolicFloat> bindings;
    for (const Instruction &instr: side) {
        std::vector<SymbolicFloat> operands;
        for (const Operand &op: instr.getOperands()) {
            if (op.isLiteral()) {
                if (boolean && instr.isUntyped() && &instr == &side.back() && op.getValue().isUndefined()) {
                    operands.push_back(SymbolicFloat::undefined(SymbolicFloat::BoolClasses));
                } else {
                    operands.push_back(op.getValue());
                }
                continue;
            }
            const std::map<std::string, SymbolicFloat> &scope = op.isBinding() ? bindings : values;
            auto it = scope.find(op.getName());
            if (it == scope.end()) {
                throw UnboundName("no value for " + op.getName());
            }
            operands.push_back(it->second);
        }

        FlagSet flags = instr.getFlags();
        auto extra = extraFlags.find(instr.getResult());
        if (isLhs && extra != extraFlags.end()) {
            for (FlagSet::Flag f: extra->second.effective()) {
                flags = flags.with(f);
            }
        }

        SymbolicFloat res = instr.getOpcode() == Op::FCmp
                ? Semantics::evaluate(instr.getPredicate(), operands, flags, type)
                : Semantics::evaluate(instr.getOpcode(), operands, flags, type);
        debugChecker(instr << " evaluates to " << res);
        bindings.erase(instr.getResult());
        bindings.emplace(instr.getResult(), res);
    }
    return bindings.at(side.back().getResult());
}
