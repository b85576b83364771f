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

#include "result.hpp"

using namespace std;

option<SymbolicFloat> Counterexample::value(const std::string &name) const {
    for (const auto &p: values) {
        if (p.first == name) {
            return p.second;
        }
    }
    return {};
}

std::ostream& operator<<(std::ostream &s, const Counterexample &cex) {
    s << "type " << FloatType::name(cex.type);
    if (cex.converse) {
        s << " (converse direction)";
    }
    s << endl;
    for (const auto &p: cex.values) {
        s << "  " << p.first << " = " << p.second << endl;
    }
    for (const auto &p: cex.flags) {
        s << "  " << p.first << ": " << (p.second ? "set" : "not set") << endl;
    }
    for (const auto &p: cex.analyses) {
        s << "  " << p.first << " = " << (p.second ? "true" : "false") << endl;
    }
    s << "  source: ";
    if (cex.source) {
        s << cex.source.get();
    } else {
        s << "?";
    }
    s << endl << "  target: ";
    if (cex.target) {
        s << cex.target.get();
    } else {
        s << "?";
    }
    return s;
}


VerificationResult::VerificationResult(Outcome outcome): outcome(outcome) {}

VerificationResult VerificationResult::proved() {
    return VerificationResult(Proved);
}

VerificationResult VerificationResult::disproved(const Counterexample &cex) {
    VerificationResult res(Disproved);
    res.cex = cex;
    return res;
}

VerificationResult VerificationResult::unknown(const std::string &reason) {
    VerificationResult res(Unknown);
    res.reason = reason;
    return res;
}

VerificationResult VerificationResult::malformed(const std::string &reason) {
    VerificationResult res(Malformed);
    res.reason = reason;
    return res;
}

VerificationResult::Outcome VerificationResult::getOutcome() const {
    return outcome;
}

bool VerificationResult::isProved() const {
    return outcome == Proved;
}

bool VerificationResult::isDisproved() const {
    return outcome == Disproved;
}

const std::string& VerificationResult::getReason() const {
    return reason;
}

const option<Counterexample>& VerificationResult::getCounterexample() const {
    return cex;
}

const std::vector<std::string>& VerificationResult::getWarnings() const {
    return warnings;
}

void VerificationResult::addWarning(const std::string &warning) {
    warnings.push_back(warning);
}

std::string VerificationResult::name(Outcome outcome) {
    switch (outcome) {
    case Proved: return "PROVED";
    case Disproved: return "DISPROVED";
    case Unknown: return "UNKNOWN";
    case Malformed: return "MALFORMED";
    }
    return "?";
}

std::ostream& operator<<(std::ostream &s, const VerificationResult &res) {
    s << VerificationResult::name(res.outcome);
    if (res.outcome == VerificationResult::Unknown || res.outcome == VerificationResult::Malformed) {
        s << " (" << res.reason << ")";
    }
    return s;
}
