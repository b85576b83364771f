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

#ifndef FPRV_EVALUATOR_HPP
#define FPRV_EVALUATOR_HPP

#include <map>
#include <set>
#include <string>
#include <z3++.h>

#include "precondition.hpp"
#include "../semantics/flags.hpp"
#include "../semantics/semantics.hpp"
#include "../smt/z3/z3context.hpp"

/**
 * Everything a precondition can ask about a rule encoding.
 */
class PreconditionEnvironment {
public:
    virtual Z3Context& context() = 0;

    /**
     * The value of an operand as seen by the precondition.
     * The poison term also covers operands that are undefined.
     */
    virtual Term operand(const Operand &op) = 0;

    /**
     * Whether the given flag holds for the lhs instruction with the given result.
     * Throws UnboundName if there is no such instruction.
     */
    virtual z3::expr flag(const std::string &binding, FlagSet::Flag flag) = 0;

    /**
     * The answer of the analysis CannotBeNegativeZero for a free operand.
     * It may only be true if the operand is neither -0.0 nor undefined.
     */
    virtual z3::expr cannotBeNegativeZero(const Operand &op) = 0;

    virtual ~PreconditionEnvironment();
};

/**
 * A concrete situation a precondition can be evaluated in.
 */
struct Assignment {
    // the values of inputs and constants
    std::map<std::string, SymbolicFloat> values;

    // the flags of the lhs instructions, by result
    std::map<std::string, FlagSet> flags;

    // inputs and constants that an analysis proved to be different from -0.0
    std::set<std::string> notNegativeZero;
};

namespace PreconditionEvaluator {

    /**
     * Encodes the precondition as a boolean z3 term.
     * Throws MalformedRule for unknown predicates or wrong arities, UnboundName for unbound names.
     */
    z3::expr encode(const Precondition &pre, PreconditionEnvironment &env);

    /**
     * Evaluates the precondition in a concrete situation.
     * Comparisons involving undefined values or poison are false.
     */
    bool evaluate(const Precondition &pre, const Assignment &assignment);

    /**
     * Throws MalformedRule if a predicate is unknown or called with the wrong number or kind of arguments.
     */
    void check(const Precondition &pre);

}

#endif // FPRV_EVALUATOR_HPP
