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

#include "flags.hpp"

using namespace std;

const std::vector<FlagSet::Flag> FlagSet::all = {NoNaNs, NoInfs, NoSignedZeros};

FlagSet::FlagSet(): bits(0), fast(false) {}

FlagSet FlagSet::fastMath() {
    FlagSet res;
    res.fast = true;
    return res;
}

bool FlagSet::has(Flag flag) const {
    return fast || (bits & flag) != 0;
}

bool FlagSet::isFast() const {
    return fast;
}

bool FlagSet::empty() const {
    return !fast && bits == 0;
}

FlagSet FlagSet::with(Flag flag) const {
    FlagSet res = *this;
    res.bits |= flag;
    return res;
}

FlagSet FlagSet::without(Flag flag) const {
    FlagSet res = *this;
    if (res.fast) {
        res.fast = false;
        for (Flag f: all) {
            res.bits |= f;
        }
    }
    res.bits &= ~static_cast<unsigned>(flag);
    return res;
}

std::vector<FlagSet::Flag> FlagSet::effective() const {
    std::vector<Flag> res;
    for (Flag f: all) {
        if (has(f)) {
            res.push_back(f);
        }
    }
    return res;
}

bool FlagSet::insert(const std::string &name) {
    if (name == "fast") {
        fast = true;
        return true;
    }
    option<Flag> flag = parse(name);
    if (!flag) {
        return false;
    }
    bits |= flag.get();
    return true;
}

std::string FlagSet::name(Flag flag) {
    switch (flag) {
    case NoNaNs: return "nnan";
    case NoInfs: return "ninf";
    case NoSignedZeros: return "nsz";
    }
    return "?";
}

option<FlagSet::Flag> FlagSet::parse(const std::string &name) {
    for (Flag f: all) {
        if (FlagSet::name(f) == name) {
            return f;
        }
    }
    return {};
}

bool FlagSet::operator==(const FlagSet &that) const {
    return bits == that.bits && fast == that.fast;
}

bool FlagSet::operator!=(const FlagSet &that) const {
    return !(*this == that);
}

std::ostream& operator<<(std::ostream &s, const FlagSet &flags) {
    bool first = true;
    for (FlagSet::Flag f: FlagSet::all) {
        if (flags.bits & f) {
            if (!first) s << " ";
            s << FlagSet::name(f);
            first = false;
        }
    }
    if (flags.fast) {
        if (!first) s << " ";
        s << "fast";
    }
    return s;
}
