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

#ifndef FPRV_PRECONDITION_HPP
#define FPRV_PRECONDITION_HPP

#include "../rule/operand.hpp"
#include "../semantics/flags.hpp"
#include "../util/option.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

class PreExpression;
typedef std::shared_ptr<const PreExpression> Precondition;

/**
 * A call of a named predicate, e.g., hasNSZ(%r).
 * Unknown names are kept (with kind none), so that the rule can be reported as malformed.
 */
struct PredicateCall {
    enum Kind { HasNSZ, HasNoInf, HasNoNaN, CannotBeNegativeZero };

    std::string name;
    option<Kind> kind;
    std::vector<Operand> args;

    PredicateCall(const std::string &name, const std::vector<Operand> &args);

    static option<Kind> parseKind(const std::string &name);

    // hasNSZ, hasNoInf and hasNoNaN ask for a flag of an instruction, the others are analyses
    static bool isFlagPredicate(Kind kind);

    // the flag a predicate asks for, CannotBeNegativeZero of an instruction result asks for nsz
    static FlagSet::Flag flag(Kind kind);
};

/**
 * An IEEE comparison of two operands. != is the negation of ==, so it is true for NaN.
 */
struct Comparison {
    enum Relation { Eq, Neq, Lt, Le, Gt, Ge };

    Operand lhs;
    Relation rel;
    Operand rhs;

    Comparison(const Operand &lhs, Relation rel, const Operand &rhs): lhs(lhs), rel(rel), rhs(rhs) {}

    static std::string name(Relation rel);
};

class PreExpression {
public:
    virtual option<bool> getConst() const;
    virtual option<PredicateCall> getPredicate() const;
    virtual option<Comparison> getComparison() const;
    virtual bool isNot() const;
    virtual bool isAnd() const;
    virtual bool isOr() const;
    virtual std::vector<Precondition> getChildren() const;
    virtual void print(std::ostream &s) const = 0;
    virtual ~PreExpression();

    void collectPredicates(std::vector<PredicateCall> &res) const;
    void collectOperands(std::vector<Operand> &res) const;
};

class PreConst: public PreExpression {
public:
    PreConst(bool value);
    option<bool> getConst() const override;
    void print(std::ostream &s) const override;

private:
    bool value;
};

class PrePredicate: public PreExpression {
public:
    PrePredicate(const PredicateCall &call);
    option<PredicateCall> getPredicate() const override;
    void print(std::ostream &s) const override;

private:
    PredicateCall call;
};

class PreComparison: public PreExpression {
public:
    PreComparison(const Comparison &cmp);
    option<Comparison> getComparison() const override;
    void print(std::ostream &s) const override;

private:
    Comparison cmp;
};

class PreNegation: public PreExpression {
public:
    PreNegation(const Precondition &arg);
    bool isNot() const override;
    std::vector<Precondition> getChildren() const override;
    void print(std::ostream &s) const override;

private:
    Precondition arg;
};

enum JunctionOperator { JunctionAnd, JunctionOr };

class PreJunction: public PreExpression {
public:
    PreJunction(const std::vector<Precondition> &children, JunctionOperator op);
    bool isAnd() const override;
    bool isOr() const override;
    std::vector<Precondition> getChildren() const override;
    void print(std::ostream &s) const override;

private:
    std::vector<Precondition> children;
    JunctionOperator op;
};

namespace Pre {

    extern const Precondition True;

    Precondition predicate(const std::string &name, const std::vector<Operand> &args);
    Precondition compare(const Operand &lhs, Comparison::Relation rel, const Operand &rhs);
    Precondition buildAnd(const std::vector<Precondition> &xs);
    Precondition buildOr(const std::vector<Precondition> &xs);

    bool isTrue(const Precondition &pre);

}

const Precondition operator &(const Precondition &a, const Precondition &b);
const Precondition operator |(const Precondition &a, const Precondition &b);
const Precondition operator !(const Precondition &a);

std::ostream& operator<<(std::ostream &s, const Precondition &e);

#endif // FPRV_PRECONDITION_HPP
