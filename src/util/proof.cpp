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

#include "proof.hpp"
#include "../config.hpp"

#include <boost/algorithm/string.hpp>

unsigned int Proof::defaultProofLevel = 1;
unsigned int Proof::maxProofLevel = 2;
unsigned int Proof::proofLevel = defaultProofLevel;

namespace {

    const std::string& color(Proof::Style style) {
        switch (style) {
        case Proof::Section: return Config::Color::Section;
        case Proof::Headline: return Config::Color::Headline;
        case Proof::Result: return Config::Color::Result;
        case Proof::Warning: return Config::Color::Warning;
        case Proof::None: break;
        }
        return Config::Color::None;
    }

}

void Proof::setProofLevel(unsigned int level) {
    proofLevel = level;
}

unsigned int Proof::getProofLevel() {
    return proofLevel;
}

void Proof::append(const std::string &s) {
    append(None, s);
}

void Proof::append(Style style, const std::string &s) {
    if (proofLevel == 0) {
        return;
    }
    std::vector<std::string> split;
    boost::split(split, s, boost::is_any_of("\n"));
    for (const std::string &l: split) {
        lines.emplace_back(style, l);
    }
}

void Proof::headline(const std::string &s) {
    append(std::string());
    append(Headline, s);
}

void Proof::section(const std::string &s) {
    append(std::string());
    append(Section, s);
}

void Proof::result(const std::string &s) {
    append(Result, s);
}

void Proof::warning(const std::string &s) {
    append(Warning, s);
}

void Proof::storeSubProof(const Proof &subProof, const std::string &technique) {
    if (proofLevel < maxProofLevel || subProof.lines.empty()) {
        return;
    }
    append("Sub-proof via " + technique + ":");
    lines.insert(lines.end(), subProof.lines.begin(), subProof.lines.end());
}

void Proof::print(std::ostream &s) const {
    for (const auto &l: lines) {
        if (Config::Output::Colors) {
            s << color(l.first) << l.second << Config::Color::None;
        } else {
            s << l.second;
        }
        s << std::endl;
    }
}
