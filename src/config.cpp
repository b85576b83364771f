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

#include "config.hpp"

using namespace std;

/**
 * Global settings and constants.
 *
 * Variables which are "const" should mostly not be changed.
 * The other variables may be changed (e.g., to choose which types are checked)
 * and may be controlled via command line options.
 */
namespace Config {

    namespace Output {
        // Whether to enable colors in the proof output
        bool Colors = true;
    }

    namespace Color {
        // Proof output
        const std::string Section = "\033[0;4;33m"; // underlined yellow
        const std::string Headline = "\033[1;4;33m"; // bold underlined yellow
        const std::string Warning = "\033[1;31m"; // bold red
        const std::string Result = "\033[1;32m"; // bold green
        const std::string None = "\033[0m"; // reset color

        // Debugging
        const std::string Debug = "\033[0;90m"; // gray/bright black (avoid distraction)
        const std::string DebugProblem = "\033[1;31m"; // bold red
        const std::string DebugWarning = "\033[0;31m"; // red
        const std::string DebugHighlight = "\033[1;34m"; // bold blue
    }

    namespace Smt {
        // Timeout (in milliseconds) for each refinement query of a rule.
        // Exceeding it turns the rule into UNKNOWN(timeout) instead of blocking.
        unsigned RuleTimeout = 10000u;

        // Timeout (in milliseconds) for the small queries of the concrete evaluator.
        const unsigned EvaluationTimeout = 2000u;

        // Nondeterministic boolean choices of the lhs (signs of nsz zeros) are eliminated
        // by expanding the universal quantifier if there are at most this many of them.
        // Otherwise, the query contains a z3 quantifier.
        const unsigned MaxExpandedChoices = 6;
    }

    namespace FastMath {
        // The encoding of fast-math flags, the others are kept to compare with older semantics
        Encoding Semantics = Poison;

        std::string name(Encoding e) {
            switch (e) {
            case Poison: return "poison";
            case Undef: return "undef";
            case OldNSZ: return "old-nsz";
            case BrokenNSZ: return "broken-nsz";
            }
            return "?";
        }

        option<Encoding> parse(const std::string &str) {
            for (Encoding e: {Poison, Undef, OldNSZ, BrokenNSZ}) {
                if (name(e) == str) {
                    return e;
                }
            }
            return {};
        }
    }

    namespace Verify {
        // Types each rule is checked for, unless the rule pins one.
        // Half precision first, it usually yields the smallest counterexamples.
        std::vector<FloatType::Type> Types = {FloatType::Half, FloatType::Single, FloatType::Double};

        // Whether disabled rules are re-enabled and checked as well.
        bool CheckDisabled = false;

        // Whether free inputs may be undef or poison.
        // Constants never are.
        bool UndefInputs = true;
        bool PoisonInputs = true;

        // Whether proved rules are checked again with each of their lhs flags removed,
        // to report flags that are not needed for soundness.
        bool FlagMinimality = true;

        // Number of rules that are checked concurrently.
        unsigned Jobs = 4;
    }

    void printConfig(std::ostream &s) {
        s << "Smt::RuleTimeout = " << Smt::RuleTimeout << endl;
        s << "Smt::EvaluationTimeout = " << Smt::EvaluationTimeout << endl;
        s << "Smt::MaxExpandedChoices = " << Smt::MaxExpandedChoices << endl;
        s << "FastMath::Semantics = " << FastMath::name(FastMath::Semantics) << endl;
        s << "Verify::Types =";
        for (FloatType::Type t: Verify::Types) {
            s << " " << FloatType::name(t);
        }
        s << endl;
        s << "Verify::CheckDisabled = " << Verify::CheckDisabled << endl;
        s << "Verify::UndefInputs = " << Verify::UndefInputs << endl;
        s << "Verify::PoisonInputs = " << Verify::PoisonInputs << endl;
        s << "Verify::FlagMinimality = " << Verify::FlagMinimality << endl;
        s << "Verify::Jobs = " << Verify::Jobs << endl;
    }

}
