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

#ifndef FPRV_REPORT_HPP
#define FPRV_REPORT_HPP

#include <ostream>
#include <string>
#include <vector>

#include "result.hpp"
#include "../rule/corpus.hpp"
#include "../rule/rule.hpp"
#include "../util/proof.hpp"

/**
 * The results of checking all active rules of a corpus, in corpus order.
 */
class Report {
public:
    struct Entry {
        Rule rule;
        VerificationResult result;
        Proof proof;

        Entry(const Rule &rule, const VerificationResult &result, const Proof &proof)
            : rule(rule), result(result), proof(proof) {}
    };

    /**
     * Checks the active rules with the given number of concurrent workers.
     * Rules that have not been started when the soft timeout is reached are UNKNOWN(timeout).
     */
    static Report run(const Corpus &corpus, unsigned jobs);

    const std::vector<Entry>& getEntries() const;
    size_t disabledCount() const;
    size_t count(VerificationResult::Outcome outcome) const;

    // true if no rule is DISPROVED or MALFORMED
    bool success() const;

    // results with their counterexamples and warnings, followed by the summary
    void print(Proof &proof) const;

    // e.g. "12 rules checked: 11 proved, 1 disproved, 0 unknown, 0 malformed; 2 disabled"
    std::string summary() const;

    friend std::ostream& operator<<(std::ostream &s, const Report &report);

private:
    std::vector<Entry> entries;
    size_t disabled = 0;
};

#endif // FPRV_REPORT_HPP
