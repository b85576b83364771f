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

#ifndef FPRV_FLAGS_HPP
#define FPRV_FLAGS_HPP

#include <ostream>
#include <string>
#include <vector>

#include "../util/option.hpp"

/**
 * The fast-math flags of an instruction.
 *
 * fast implies all other flags. It is kept apart from them so that the
 * instruction can be printed the way it was written.
 */
class FlagSet {
public:
    enum Flag { NoNaNs = 1, NoInfs = 2, NoSignedZeros = 4 };

    // nnan, ninf, nsz in this order
    static const std::vector<Flag> all;

    FlagSet();

    static FlagSet fastMath();

    // whether the flag is in effect, either written or implied by fast
    bool has(Flag flag) const;
    bool isFast() const;
    bool empty() const;

    FlagSet with(Flag flag) const;

    // removes a flag, fast is replaced by the flags that remain
    FlagSet without(Flag flag) const;

    // the flags in effect, those implied by fast included
    std::vector<Flag> effective() const;

    /**
     * Adds the flag with the given name (nnan, ninf, nsz or fast).
     * @return false if the name is not a flag
     */
    bool insert(const std::string &name);

    static std::string name(Flag flag);
    static option<Flag> parse(const std::string &name);

    bool operator==(const FlagSet &that) const;
    bool operator!=(const FlagSet &that) const;

    friend std::ostream& operator<<(std::ostream &s, const FlagSet &flags);

private:
    unsigned bits;
    bool fast;
};

#endif // FPRV_FLAGS_HPP
