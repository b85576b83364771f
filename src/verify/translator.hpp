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

#ifndef FPRV_TRANSLATOR_HPP
#define FPRV_TRANSLATOR_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>
#include <z3++.h>

#include "../precondition/evaluator.hpp"
#include "../rule/rule.hpp"
#include "../semantics/semantics.hpp"
#include "../smt/z3/z3context.hpp"
#include "../util/option.hpp"
#include "../value/floattype.hpp"

/**
 * Translates a rule into z3 terms for one floating-point type.
 *
 * Inputs become floating-point variables with boolean markers that decide whether they are
 * poison or undef. Every use of an input that may be undef is a fresh choice. Choices of the
 * lhs are made by the source program, choices of the rhs by the target program.
 *
 * Flags that the precondition asks for but the lhs does not write, as well as the answers
 * of analyses, are free booleans. Their meaning is fixed by the constraints.
 */
class Translator : public PreconditionEnvironment {
public:
    struct Input {
        Operand operand;
        z3::expr value;
        option<z3::expr> poison;
        option<z3::expr> undef;

        Input(const Operand &operand, const z3::expr &value): operand(operand), value(value) {}
    };

    struct MatchedFlag {
        std::string binding;
        FlagSet::Flag flag;
        z3::expr value;

        MatchedFlag(const std::string &binding, FlagSet::Flag flag, const z3::expr &value)
            : binding(binding), flag(flag), value(value) {}
    };

    Translator(Z3Context &ctx, const Rule &rule, FloatType::Type type);

    FloatType::Type getType() const;

    // the encoded precondition, must not be called before the rule is encoded
    const z3::expr& precondition() const;

    // what the free booleans of flags and analyses mean
    const std::vector<z3::expr>& constraints() const;

    const Term& source() const;
    const Term& target() const;

    /**
     * A formula that is satisfiable iff the rhs does not refine the lhs under the precondition:
     * pre && constraints && forall sourceChoices. !sourcePoison && (targetPoison || sourceValue != targetValue)
     *
     * If definedInputs is set, all inputs are neither undef nor poison. The choices for undef
     * inputs are then not quantified.
     */
    z3::expr refinementQuery(bool definedInputs) const;

    // forces all inputs to be neither undef nor poison
    z3::expr definedInputs() const;

    // whether some input may be undef or poison
    bool hasMarkers() const;

    const std::vector<Input>& getInputs() const;
    const std::vector<MatchedFlag>& getMatchedFlags() const;
    const std::vector<std::pair<Operand, z3::expr>>& getAnalyses() const;

    // the precondition's view of the rule
    Z3Context& context() override;
    Term operand(const Operand &op) override;
    z3::expr flag(const std::string &binding, FlagSet::Flag flag) override;
    z3::expr cannotBeNegativeZero(const Operand &op) override;

private:
    void declareInputs();
    void matchFlags();
    Term encodeSide(const std::vector<Instruction> &side, bool isLhs);
    // boolean: whether a poison or undef literal stands for a one-bit value
    Term encodeOperand(const Operand &op, std::map<std::string, Term> &bindings, std::vector<z3::expr> &choices,
                       bool boolean);
    FlagTerms lhsFlags(const Instruction &instr);
    const Input& findInput(const std::string &name) const;
    bool isInputChoice(const z3::expr &choice) const;
    z3::expr eliminateChoices(const z3::expr &body, const std::vector<z3::expr> &choices) const;

    Z3Context &ctx;
    const Rule &rule;
    FloatType::Type type;
    Semantics semantics;

    std::vector<Input> inputs;
    std::vector<MatchedFlag> matched;
    std::vector<std::pair<Operand, z3::expr>> analyses;
    std::vector<z3::expr> constraintList;

    std::vector<z3::expr> srcChoices;
    std::vector<z3::expr> inputChoices;
    std::vector<z3::expr> tgtChoices;
    option<Term> src;
    option<Term> tgt;
    option<z3::expr> pre;
};

#endif // FPRV_TRANSLATOR_HPP
