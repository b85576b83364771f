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

#ifndef FPRV_CORPUS_HPP
#define FPRV_CORPUS_HPP

#include <ostream>
#include <string>
#include <vector>

#include "rule.hpp"
#include "../util/option.hpp"

/**
 * The rules of a rule file in their declared order, active as well as disabled ones.
 */
class Corpus {
public:
    void add(const Rule &rule);

    const std::vector<Rule>& getRules() const;
    std::vector<Rule> activeRules() const;
    size_t disabledCount() const;
    size_t size() const;
    bool empty() const;

    option<Rule> find(const std::string &name) const;

    // enables all disabled rules, e.g., to check whether they are still unsound
    Corpus enableAll() const;

    // restricts the corpus to the rules with the given names, keeping their order
    Corpus restrict(const std::vector<std::string> &names) const;

    friend std::ostream& operator<<(std::ostream &s, const Corpus &corpus);

private:
    std::vector<Rule> rules;
};

#endif // FPRV_CORPUS_HPP
