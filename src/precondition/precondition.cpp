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

#include "precondition.hpp"

using namespace std;


PredicateCall::PredicateCall(const std::string &name, const std::vector<Operand> &args)
    : name(name), kind(parseKind(name)), args(args) {}

option<PredicateCall::Kind> PredicateCall::parseKind(const std::string &name) {
    if (name == "hasNSZ") return HasNSZ;
    if (name == "hasNoInf") return HasNoInf;
    if (name == "hasNoNaN") return HasNoNaN;
    if (name == "CannotBeNegativeZero") return CannotBeNegativeZero;
    return {};
}

bool PredicateCall::isFlagPredicate(Kind kind) {
    return kind != CannotBeNegativeZero;
}

FlagSet::Flag PredicateCall::flag(Kind kind) {
    switch (kind) {
    case HasNoNaN: return FlagSet::NoNaNs;
    case HasNoInf: return FlagSet::NoInfs;
    default: return FlagSet::NoSignedZeros;
    }
}

std::string Comparison::name(Relation rel) {
    switch (rel) {
    case Eq: return "==";
    case Neq: return "!=";
    case Lt: return "<";
    case Le: return "<=";
    case Gt: return ">";
    case Ge: return ">=";
    }
    return "?";
}


PreExpression::~PreExpression() {}

option<bool> PreExpression::getConst() const {
    return {};
}

option<PredicateCall> PreExpression::getPredicate() const {
    return {};
}

option<Comparison> PreExpression::getComparison() const {
    return {};
}

bool PreExpression::isNot() const {
    return false;
}

bool PreExpression::isAnd() const {
    return false;
}

bool PreExpression::isOr() const {
    return false;
}

std::vector<Precondition> PreExpression::getChildren() const {
    return {};
}

void PreExpression::collectPredicates(std::vector<PredicateCall> &res) const {
    option<PredicateCall> call = getPredicate();
    if (call) {
        res.push_back(call.get());
    }
    for (const Precondition &c: getChildren()) {
        c->collectPredicates(res);
    }
}

void PreExpression::collectOperands(std::vector<Operand> &res) const {
    option<PredicateCall> call = getPredicate();
    if (call) {
        res.insert(res.end(), call->args.begin(), call->args.end());
    }
    option<Comparison> cmp = getComparison();
    if (cmp) {
        res.push_back(cmp->lhs);
        res.push_back(cmp->rhs);
    }
    for (const Precondition &c: getChildren()) {
        c->collectOperands(res);
    }
}


PreConst::PreConst(bool value): value(value) {}

option<bool> PreConst::getConst() const {
    return value;
}

void PreConst::print(std::ostream &s) const {
    s << (value ? "true" : "false");
}


PrePredicate::PrePredicate(const PredicateCall &call): call(call) {}

option<PredicateCall> PrePredicate::getPredicate() const {
    return call;
}

void PrePredicate::print(std::ostream &s) const {
    s << call.name << "(";
    for (size_t i = 0; i < call.args.size(); ++i) {
        if (i > 0) s << ", ";
        s << call.args[i];
    }
    s << ")";
}


PreComparison::PreComparison(const Comparison &cmp): cmp(cmp) {}

option<Comparison> PreComparison::getComparison() const {
    return cmp;
}

void PreComparison::print(std::ostream &s) const {
    s << cmp.lhs << " " << Comparison::name(cmp.rel) << " " << cmp.rhs;
}


PreNegation::PreNegation(const Precondition &arg): arg(arg) {}

bool PreNegation::isNot() const {
    return true;
}

std::vector<Precondition> PreNegation::getChildren() const {
    return {arg};
}

void PreNegation::print(std::ostream &s) const {
    bool atomic = arg->getConst() || arg->getPredicate() || arg->isNot();
    s << "!";
    if (!atomic) s << "(";
    arg->print(s);
    if (!atomic) s << ")";
}


PreJunction::PreJunction(const std::vector<Precondition> &children, JunctionOperator op): children(children), op(op) {}

bool PreJunction::isAnd() const {
    return op == JunctionAnd;
}

bool PreJunction::isOr() const {
    return op == JunctionOr;
}

std::vector<Precondition> PreJunction::getChildren() const {
    return children;
}

void PreJunction::print(std::ostream &s) const {
    for (size_t i = 0; i < children.size(); ++i) {
        if (i > 0) {
            s << (op == JunctionAnd ? " && " : " || ");
        }
        bool nested = children[i]->isAnd() || children[i]->isOr();
        if (nested) s << "(";
        children[i]->print(s);
        if (nested) s << ")";
    }
}


namespace Pre {

    const Precondition True = std::make_shared<PreConst>(true);

    Precondition predicate(const std::string &name, const std::vector<Operand> &args) {
        return std::make_shared<PrePredicate>(PredicateCall(name, args));
    }

    Precondition compare(const Operand &lhs, Comparison::Relation rel, const Operand &rhs) {
        return std::make_shared<PreComparison>(Comparison(lhs, rel, rhs));
    }

    static Precondition buildJunction(const std::vector<Precondition> &xs, JunctionOperator op) {
        std::vector<Precondition> children;
        for (const Precondition &x: xs) {
            // flatten nested junctions of the same kind
            if ((op == JunctionAnd && x->isAnd()) || (op == JunctionOr && x->isOr())) {
                for (const Precondition &c: x->getChildren()) {
                    children.push_back(c);
                }
            } else {
                children.push_back(x);
            }
        }
        if (children.size() == 1) {
            return children.front();
        }
        if (children.empty()) {
            return std::make_shared<PreConst>(op == JunctionAnd);
        }
        return std::make_shared<PreJunction>(children, op);
    }

    Precondition buildAnd(const std::vector<Precondition> &xs) {
        return buildJunction(xs, JunctionAnd);
    }

    Precondition buildOr(const std::vector<Precondition> &xs) {
        return buildJunction(xs, JunctionOr);
    }

    bool isTrue(const Precondition &pre) {
        option<bool> c = pre->getConst();
        return c && c.get();
    }

}

const Precondition operator &(const Precondition &a, const Precondition &b) {
    return Pre::buildAnd({a, b});
}

const Precondition operator |(const Precondition &a, const Precondition &b) {
    return Pre::buildOr({a, b});
}

const Precondition operator !(const Precondition &a) {
    return std::make_shared<PreNegation>(a);
}

std::ostream& operator<<(std::ostream &s, const Precondition &e) {
    e->print(s);
    return s;
}
