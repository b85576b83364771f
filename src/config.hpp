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

#ifndef FPRV_CONFIG_HPP
#define FPRV_CONFIG_HPP

#include <string>
#include <vector>
#include <ostream>

#include "value/floattype.hpp"
#include "util/option.hpp"

/**
 * Global settings and constants.
 *
 * Variables which are "const" should mostly not be changed.
 * The other variables may be changed (e.g., to choose which types are checked)
 * and may be controlled via command line options.
 *
 * See the source file for documentation (since this is also where the default values are defined)
 */
namespace Config {

    // Proof output
    namespace Output {
        extern bool Colors;
    }

    // Colors (Ansi color codes) for output
    namespace Color {
        extern const std::string Section;
        extern const std::string Headline;
        extern const std::string Warning;
        extern const std::string Result;
        extern const std::string None;

        extern const std::string Debug;
        extern const std::string DebugProblem;
        extern const std::string DebugWarning;
        extern const std::string DebugHighlight;
    }

    // All settings for interfacing z3
    namespace Smt {
        extern unsigned RuleTimeout;
        extern const unsigned EvaluationTimeout;
        extern const unsigned MaxExpandedChoices;
    }

    // How fast-math flags are encoded
    namespace FastMath {
        enum Encoding {
            Poison,     // a violated nnan or ninf yields poison, nsz picks the sign of zero results
            Undef,      // a violated nnan or ninf yields an undef value instead
            OldNSZ,     // nsz: -0.0 operands are poison, zero results keep their sign
            BrokenNSZ   // nsz: zero results are replaced by a value that is poison unless it is zero
        };
        extern Encoding Semantics;

        std::string name(Encoding e);
        // accepts poison, undef, old-nsz and broken-nsz
        option<Encoding> parse(const std::string &name);
    }

    // The equivalence checker
    namespace Verify {
        extern std::vector<FloatType::Type> Types;
        extern bool CheckDisabled;
        extern bool UndefInputs;
        extern bool PoisonInputs;
        extern bool FlagMinimality;
        extern unsigned Jobs;
    }

    /**
     * Prints all of the above config values to the given stream.
     * Useful to test command line flags and to include configuration benchmarks.
     */
    void printConfig(std::ostream &s);
}

#endif // FPRV_CONFIG_HPP
