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

#include "report.hpp"
#include "checker.hpp"
#include "../debug.hpp"
#include "../util/timeout.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <sstream>

using namespace std;


Report Report::run(const Corpus &corpus, unsigned jobs) {
    const std::vector<Rule> rules = corpus.activeRules();
    std::vector<option<VerificationResult>> results(rules.size());
    std::vector<Proof> proofs(rules.size());

    // workers take the next unchecked rule, each result has a slot of its own
    std::atomic<size_t> next(0);
    auto worker = [&]() {
        size_t i;
        while ((i = next++) < rules.size()) {
            if (Timeout::soft()) {
                results[i] = VerificationResult::unknown("timeout");
            } else {
                results[i] = Checker::verify(rules[i], proofs[i]);
            }
        }
    };

    size_t workers = std::max<size_t>(1, std::min<size_t>(jobs, rules.size()));
    debugChecker("checking " << rules.size() << " rules with " << workers << " workers");
    std::vector<std::future<void>> futures;
    for (size_t j = 0; j < workers; ++j) {
        futures.push_back(std::async(std::launch::async, worker));
    }
    for (std::future<void> &f: futures) {
        f.get();
    }

    Report report;
    report.disabled = corpus.disabledCount();
    for (size_t i = 0; i < rules.size(); ++i) {
        report.entries.emplace_back(rules[i], results[i].get(), proofs[i]);
    }
    return report;
}

const std::vector<Report::Entry>& Report::getEntries() const {
    return entries;
}

size_t Report::disabledCount() const {
    return disabled;
}

size_t Report::count(VerificationResult::Outcome outcome) const {
    return std::count_if(entries.begin(), entries.end(), [&](const Entry &e) {
        return e.result.getOutcome() == outcome;
    });
}

bool Report::success() const {
    return count(VerificationResult::Disproved) == 0 && count(VerificationResult::Malformed) == 0;
}

void Report::print(Proof &proof) const {
    for (const Entry &e: entries) {
        std::stringstream line;
        line << e.rule.getName() << ": " << e.result;
        if (e.result.isProved()) {
            proof.result(line.str());
        } else {
            proof.warning(line.str());
        }
        if (e.result.getCounterexample()) {
            std::stringstream cex;
            cex << e.result.getCounterexample().get();
            proof.append(cex.str());
        }
        for (const std::string &w: e.result.getWarnings()) {
            proof.warning("warning: " + w);
        }
        proof.storeSubProof(e.proof, "refinement check of " + e.rule.getName());
    }
    proof.section(summary());
}

std::string Report::summary() const {
    std::stringstream s;
    s << entries.size() << " rules checked: "
      << count(VerificationResult::Proved) << " proved, "
      << count(VerificationResult::Disproved) << " disproved, "
      << count(VerificationResult::Unknown) << " unknown, "
      << count(VerificationResult::Malformed) << " malformed; "
      << disabled << " disabled";
    return s.str();
}

std::ostream& operator<<(std::ostream &s, const Report &report) {
    for (const Report::Entry &e: report.entries) {
        s << e.rule.getName() << ": " << e.result << endl;
    }
    s << report.summary();
    return s;
}
