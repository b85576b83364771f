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

#ifndef FPRV_RULEFILE_HPP
#define FPRV_RULEFILE_HPP

#include <istream>
#include <set>
#include <string>
#include <vector>

#include "../rule/corpus.hpp"
#include "../exceptions.hpp"

/**
 * Reader for rule files. A rule looks like
 *
 *   Name: simplify:806
 *   Pre: hasNSZ(%r) || CannotBeNegativeZero(%x)
 *   %r = fadd %x, 0.0
 *     =>
 *   %r = %x
 *
 * Every rule starts with its Name: line. Pre: and Type: lines are optional and come before the
 * instructions. The sides are separated by => (or <=> for rules that hold in both directions).
 * Instructions are written as %r = opcode [flags] [predicate] [type] a, b or, to copy a value, %r = a.
 *
 * Lines starting with ; are comments. A comment "; Disabled: reason" starts a block of commented
 * rules, which are kept as disabled rules with the given reason. The block ends at the first line
 * that is not a comment.
 *
 * Problems within a rule (unknown opcodes, bad operands, unparsable preconditions) do not abort
 * reading, the rule is added as a malformed rule instead.
 */
namespace rulefile {

    EXCEPTION(RuleFileError, CustomException);
    EXCEPTION(RuleSyntaxError, RuleFileError);

    class RuleFileParser {

    public:
        static Corpus loadFromFile(const std::string &filename);
        static Corpus loadFromString(const std::string &text);

    private:
        struct Block {
            std::string name;
            unsigned int line;
            bool disabled;
            std::string reason;
            std::vector<std::pair<unsigned int, std::string>> lines;
        };

        void run(std::istream &in);

        void finishBlock();

        Rule parseRule(const Block &block) const;

        Instruction parseInstruction(const std::string &str, const std::set<std::string> &bindings) const;

        Operand parseOperand(const std::string &str, const std::set<std::string> &bindings) const;

        static std::string trim(const std::string &str, const std::string &prefix);

        Corpus res;
        option<Block> current;

        const std::string COMMENT = ";";
        const std::string DISABLED = "Disabled:";
        const std::string NAME = "Name:";
        const std::string PRE = "Pre:";
        const std::string TYPE = "Type:";
        const std::string ARROW = "=>";
        const std::string BIARROW = "<=>";
        const std::string ASSIGN = "=";

    };

}

#endif // FPRV_RULEFILE_HPP
