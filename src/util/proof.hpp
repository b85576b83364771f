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

#ifndef FPRV_PROOF_HPP
#define FPRV_PROOF_HPP

#include <ostream>
#include <string>
#include <vector>

/**
 * Collects the human readable output of a verification run.
 *
 * Lines are only stored if the proof level is positive, so building a proof is cheap if it is disabled.
 * Each line carries a style, which is rendered as ANSI color if Config::Output::Colors is set.
 */
class Proof {
public:
    enum Style {
        Section,
        Headline,
        Result,
        Warning,
        None
    };

    static unsigned int defaultProofLevel;
    static unsigned int maxProofLevel;

    static void setProofLevel(unsigned int proofLevel);
    static unsigned int getProofLevel();

    void append(const std::string &s);

    // multi-line strings are split, every line gets the given style
    void append(Style style, const std::string &s);

    void headline(const std::string &s);

    void section(const std::string &s);

    void result(const std::string &s);

    void warning(const std::string &s);

    // details are only kept for the highest proof level
    void storeSubProof(const Proof &subProof, const std::string &technique);

    void print(std::ostream &s) const;

private:
    static unsigned int proofLevel;

    std::vector<std::pair<Style, std::string>> lines;

};

#endif // FPRV_PROOF_HPP
