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

#ifndef FPRV_RESULT_HPP
#define FPRV_RESULT_HPP

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "../util/option.hpp"
#include "../value/floattype.hpp"
#include "../value/symbolicfloat.hpp"

/**
 * A situation in which the rhs of a rule does not refine its lhs.
 */
struct Counterexample {
    FloatType::Type type;

    // whether it was found for the converse of a bidirectional rule
    bool converse = false;

    // the inputs and constants, in the order of their first occurrence
    std::vector<std::pair<std::string, SymbolicFloat>> values;

    // the flags that the precondition asks for but the lhs does not write, e.g. "nsz %r"
    std::vector<std::pair<std::string, bool>> flags;

    // the answers of analyses, e.g. "CannotBeNegativeZero(%x)"
    std::vector<std::pair<std::string, bool>> analyses;

    // the results of both sides, none if they could not be recomputed
    option<SymbolicFloat> source;
    option<SymbolicFloat> target;

    Counterexample(FloatType::Type type): type(type) {}

    option<SymbolicFloat> value(const std::string &name) const;
};

std::ostream& operator<<(std::ostream &s, const Counterexample &cex);


class VerificationResult {
public:
    enum Outcome { Proved, Disproved, Unknown, Malformed };

    static VerificationResult proved();
    static VerificationResult disproved(const Counterexample &cex);
    static VerificationResult unknown(const std::string &reason);
    static VerificationResult malformed(const std::string &reason);

    Outcome getOutcome() const;
    bool isProved() const;
    bool isDisproved() const;

    // why the result is UNKNOWN or MALFORMED
    const std::string& getReason() const;

    const option<Counterexample>& getCounterexample() const;

    const std::vector<std::string>& getWarnings() const;
    void addWarning(const std::string &warning);

    static std::string name(Outcome outcome);

    friend std::ostream& operator<<(std::ostream &s, const VerificationResult &res);

private:
    VerificationResult(Outcome outcome);

    Outcome outcome;
    std::string reason;
    option<Counterexample> cex;
    std::vector<std::string> warnings;
};

#endif // FPRV_RESULT_HPP
