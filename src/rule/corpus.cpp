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

#include "corpus.hpp"

#include <algorithm>

using namespace std;

void Corpus::add(const Rule &rule) {
    rules.push_back(rule);
}

const std::vector<Rule>& Corpus::getRules() const {
    return rules;
}

std::vector<Rule> Corpus::activeRules() const {
    std::vector<Rule> res;
    for (const Rule &rule: rules) {
        if (rule.isActive()) {
            res.push_back(rule);
        }
    }
    return res;
}

size_t Corpus::disabledCount() const {
    return std::count_if(rules.begin(), rules.end(), [](const Rule &rule) { return !rule.isActive(); });
}

size_t Corpus::size() const {
    return rules.size();
}

bool Corpus::empty() const {
    return rules.empty();
}

option<Rule> Corpus::find(const std::string &name) const {
    for (const Rule &rule: rules) {
        if (rule.getName() == name) {
            return rule;
        }
    }
    return {};
}

Corpus Corpus::enableAll() const {
    Corpus res;
    for (const Rule &rule: rules) {
        res.add(rule.enable());
    }
    return res;
}

Corpus Corpus::restrict(const std::vector<std::string> &names) const {
    Corpus res;
    for (const Rule &rule: rules) {
        if (std::find(names.begin(), names.end(), rule.getName()) != names.end()) {
            res.add(rule);
        }
    }
    return res;
}

std::ostream& operator<<(std::ostream &s, const Corpus &corpus) {
    for (size_t i = 0; i < corpus.rules.size(); ++i) {
        if (i > 0) s << std::endl << std::endl;
        s << corpus.rules[i];
    }
    return s << std::endl;
}
