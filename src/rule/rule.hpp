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

#ifndef FPRV_RULE_HPP
#define FPRV_RULE_HPP

#include <ostream>
#include <string>
#include <vector>

#include "instruction.hpp"
#include "../precondition/precondition.hpp"
#include "../util/option.hpp"

/**
 * A rewrite rule: under its precondition, the lhs instructions may be replaced by the rhs instructions.
 * The last instruction of each side is its result, both results have the same name.
 *
 * Rules are immutable. Disabled rules are kept together with the reason why they are disabled,
 * they are not checked unless they are enabled again.
 *
 * A rule that could not even be built (e.g., because its text does not parse) is represented
 * by a malformed rule, which carries only its name and the problem.
 */
class Rule {
public:
    Rule(const std::string &name, const Precondition &pre, const std::vector<Instruction> &lhs,
         const std::vector<Instruction> &rhs, bool bidirectional = false, const option<FloatType::Type> &type = {});

    static Rule malformed(const std::string &name, const std::string &reason);

    const std::string& getName() const;
    const Precondition& getPrecondition() const;
    const std::vector<Instruction>& getLhs() const;
    const std::vector<Instruction>& getRhs() const;
    const Instruction& lhsRoot() const;
    const Instruction& rhsRoot() const;
    bool isBidirectional() const;

    // the type written in the Type: line, if any
    const option<FloatType::Type>& getType() const;

    bool isActive() const;
    const std::string& getReason() const;

    bool isMalformed() const;

    /**
     * The type the rule is restricted to, by its Type: line or by the types written in its instructions.
     * Throws MalformedRule if these disagree.
     */
    option<FloatType::Type> pinnedType() const;

    // the inputs and constants of the lhs, in the order of their first occurrence
    std::vector<Operand> freeVariables() const;

    option<Instruction> lhsDefinition(const std::string &binding) const;

    /**
     * Whether the named instruction result of the given side (lhs or rhs of this rule) is a one-bit value.
     * Poison and undef that are copied to the result have the type of the other side's result.
     */
    bool isBoolean(const std::vector<Instruction> &side, const std::string &binding) const;

    /**
     * Checks that the rule can be verified at all.
     * Throws MalformedRule otherwise.
     */
    void validate() const;

    Rule disable(const std::string &reason) const;
    Rule enable() const;
    Rule withPrecondition(const Precondition &pre) const;

    // removes a flag of the lhs instruction with the given index, also one implied by fast
    Rule withoutFlag(size_t lhsIndex, FlagSet::Flag flag) const;

    // the converse rule, the rhs becomes the lhs
    Rule reversed() const;

    friend std::ostream& operator<<(std::ostream &s, const Rule &rule);

private:
    // none for poison and undef
    option<bool> resultType(const std::vector<Instruction> &side, const std::string &binding) const;
    // whether the result of the side is a copy of binding
    bool aliasesRoot(const std::vector<Instruction> &side, const std::string &binding) const;

    void validateSide(const std::vector<Instruction> &side, bool isLhs) const;

    std::string name;
    Precondition pre;
    std::vector<Instruction> lhs;
    std::vector<Instruction> rhs;
    bool bidirectional;
    option<FloatType::Type> type;
    bool active = true;
    std::string reason;
    option<std::string> malformedReason;
};

#endif // FPRV_RULE_HPP
