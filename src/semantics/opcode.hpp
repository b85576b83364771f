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

#ifndef FPRV_OPCODE_HPP
#define FPRV_OPCODE_HPP

#include <string>

#include "../util/option.hpp"

namespace Op {

    enum Opcode { FAdd, FSub, FMul, FDiv, FRem, FCmp, Copy };

    // IEEE comparison predicates, the unordered ones are also true if an operand is NaN
    enum Predicate { PredFalse, OEQ, OGT, OGE, OLT, OLE, ONE, ORD, UEQ, UGT, UGE, ULT, ULE, UNE, UNO, PredTrue };

    std::string name(Opcode op);
    std::string name(Predicate pred);

    option<Opcode> parseOpcode(const std::string &name);
    option<Predicate> parsePredicate(const std::string &name);

    unsigned arity(Opcode op);

    bool isArithmetic(Opcode op);

    // whether the result is a one-bit value
    bool isBoolean(Opcode op);

}

#endif // FPRV_OPCODE_HPP
