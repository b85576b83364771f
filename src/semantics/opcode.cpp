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

#include "opcode.hpp"

#include <vector>

namespace Op {

    static const std::vector<Opcode> opcodes = {FAdd, FSub, FMul, FDiv, FRem, FCmp, Copy};

    static const std::vector<Predicate> predicates = {
        PredFalse, OEQ, OGT, OGE, OLT, OLE, ONE, ORD, UEQ, UGT, UGE, ULT, ULE, UNE, UNO, PredTrue
    };

    std::string name(Opcode op) {
        switch (op) {
        case FAdd: return "fadd";
        case FSub: return "fsub";
        case FMul: return "fmul";
        case FDiv: return "fdiv";
        case FRem: return "frem";
        case FCmp: return "fcmp";
        case Copy: return "copy";
        }
        return "?";
    }

    std::string name(Predicate pred) {
        switch (pred) {
        case PredFalse: return "false";
        case OEQ: return "oeq";
        case OGT: return "ogt";
        case OGE: return "oge";
        case OLT: return "olt";
        case OLE: return "ole";
        case ONE: return "one";
        case ORD: return "ord";
        case UEQ: return "ueq";
        case UGT: return "ugt";
        case UGE: return "uge";
        case ULT: return "ult";
        case ULE: return "ule";
        case UNE: return "une";
        case UNO: return "uno";
        case PredTrue: return "true";
        }
        return "?";
    }

    option<Opcode> parseOpcode(const std::string &str) {
        for (Opcode op: opcodes) {
            if (op != Copy && name(op) == str) {
                return op;
            }
        }
        return {};
    }

    option<Predicate> parsePredicate(const std::string &str) {
        for (Predicate pred: predicates) {
            if (name(pred) == str) {
                return pred;
            }
        }
        return {};
    }

    unsigned arity(Opcode op) {
        return op == Copy ? 1 : 2;
    }

    bool isArithmetic(Opcode op) {
        return op != FCmp && op != Copy;
    }

    bool isBoolean(Opcode op) {
        return op == FCmp;
    }

}
