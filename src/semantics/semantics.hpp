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

#ifndef FPRV_SEMANTICS_HPP
#define FPRV_SEMANTICS_HPP

#include <vector>
#include <z3++.h>

#include "flags.hpp"
#include "opcode.hpp"
#include "../smt/z3/z3context.hpp"
#include "../value/floattype.hpp"
#include "../value/symbolicfloat.hpp"

/**
 * The encoding of a value: the value itself (a floating-point term, or a boolean term for
 * the results of comparisons) together with a boolean term that is true iff it is poison.
 * If poison is true, value is irrelevant.
 */
struct Term {
    z3::expr value;
    z3::expr poison;

    Term(const z3::expr &value, const z3::expr &poison): value(value), poison(poison) {}
};

/**
 * The fast-math flags of one instruction as boolean terms.
 * These are constants unless the flag is left to the matched program.
 */
struct FlagTerms {
    z3::expr nnan;
    z3::expr ninf;
    z3::expr nsz;

    FlagTerms(const z3::expr &nnan, const z3::expr &ninf, const z3::expr &nsz): nnan(nnan), ninf(ninf), nsz(nsz) {}

    static FlagTerms of(const Z3Context &ctx, const FlagSet &flags);
};


/**
 * IEEE-754 semantics of the supported instructions, with round to nearest, ties to even.
 *
 * - a poison operand yields poison, no instruction absorbs it
 * - nnan: NaN operands and NaN results are poison
 * - ninf: infinite operands and infinite results are poison
 * - nsz: the sign of a zero result is a nondeterministic choice
 *
 * Config::FastMath::Semantics selects another encoding of the flags of arithmetic instructions.
 * Comparisons always use the one above.
 */
class Semantics {

public:
    Semantics(Z3Context &ctx, FloatType::Type type);

    /**
     * Encodes one instruction.
     * @param pred only relevant for fcmp
     * @param choices the fresh nondeterministic choices of this instruction are appended to it
     */
    Term encode(Op::Opcode op, Op::Predicate pred, const std::vector<Term> &operands, const FlagTerms &flags,
                std::vector<z3::expr> &choices);

    /**
     * Evaluates an instruction on concrete operands (literals, undefined values or poison).
     * Undefined results are narrowed to the classes they can actually take,
     * and a result that may be poison is poison.
     * Throws NotConcrete for variables and SolverUnknown if z3 does not answer in time.
     */
    static SymbolicFloat evaluate(Op::Opcode op, const std::vector<SymbolicFloat> &operands, const FlagSet &flags,
                                  FloatType::Type type = FloatType::Double);
    static SymbolicFloat evaluate(Op::Predicate pred, const std::vector<SymbolicFloat> &operands, const FlagSet &flags,
                                  FloatType::Type type = FloatType::Double);

    /**
     * Narrows a term to the concrete value it denotes under the given constraints.
     * This is shared by the concrete evaluator and the counterexample printer.
     */
    static SymbolicFloat concretize(Z3Context &ctx, const Term &term, const std::vector<z3::expr> &constraints, bool isBool);

private:
    Term arithmetic(Op::Opcode op, const Term &x, const Term &y, const FlagTerms &flags, std::vector<z3::expr> &choices);
    Term compare(Op::Predicate pred, const Term &x, const Term &y, const FlagTerms &flags);

    static SymbolicFloat evaluate(Op::Opcode op, Op::Predicate pred, const std::vector<SymbolicFloat> &operands,
                                  const FlagSet &flags, FloatType::Type type);

    Z3Context &ctx;
    FloatType::Type type;
};

#endif // FPRV_SEMANTICS_HPP
