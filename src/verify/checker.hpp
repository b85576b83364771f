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

#ifndef FPRV_CHECKER_HPP
#define FPRV_CHECKER_HPP

#include <vector>
#include <z3++.h>

#include "result.hpp"
#include "translator.hpp"
#include "../rule/rule.hpp"
#include "../util/proof.hpp"
#include "../value/floattype.hpp"

/**
 * Decides whether the rhs of a rule refines its lhs, for every type the rule is checked for.
 *
 * Each call owns its z3 contexts, so rules can be checked concurrently.
 */
class Checker {
public:
    /**
     * Every rule yields exactly one result, the checker does not throw.
     * Malformed rules are MALFORMED, solver failures and any other error are UNKNOWN.
     */
    static VerificationResult verify(const Rule &rule);

    // as above, the steps of the check are recorded in the given proof
    static VerificationResult verify(const Rule &rule, Proof &proof);

private:
    Checker(const Rule &rule, Proof &proof);

    VerificationResult run();

    // checks one direction of the rule for all types
    VerificationResult check(const Rule &rule, bool converse, bool &vacuous);

    VerificationResult check(const Rule &rule, FloatType::Type type, bool converse, bool &vacuous);

    // adds a warning for each lhs flag that is not needed for the proof
    void checkFlags(VerificationResult &res);

    Counterexample counterexample(Z3Context &ctx, const Translator &tr, const z3::model &model, bool converse) const;

    std::vector<FloatType::Type> types() const;

    const Rule &rule;
    Proof &proof;
};

#endif // FPRV_CHECKER_HPP
