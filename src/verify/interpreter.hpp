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

#ifndef FPRV_INTERPRETER_HPP
#define FPRV_INTERPRETER_HPP

#include <map>
#include <string>
#include <vector>

#include "../rule/instruction.hpp"
#include "../semantics/flags.hpp"
#include "../value/floattype.hpp"
#include "../value/symbolicfloat.hpp"

/**
 * Runs the instructions of one side of a rule on concrete inputs.
 */
class Interpreter {
public:
    explicit Interpreter(FloatType::Type type);

    void assign(const std::string &name, const SymbolicFloat &value);

    // a flag the matched program sets although the lhs does not write it
    void addFlag(const std::string &binding, FlagSet::Flag flag);

    /**
     * The result of the last instruction.
     * If boolean is set, an undef copied to the result is a one-bit value.
     * Throws UnboundName for inputs without a value and SolverUnknown if an instruction cannot be evaluated in time.
     */
    SymbolicFloat run(const std::vector<Instruction> &side, bool isLhs, bool boolean = false) const;

private:
    FloatType::Type type;
    std::map<std::string, SymbolicFloat> values;
    std::map<std::string, FlagSet> extraFlags;
};

#endif // FPRV_INTERPRETER_HPP
