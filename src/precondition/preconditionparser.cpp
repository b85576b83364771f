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

#include "preconditionparser.hpp"
#include "../debug.hpp"

#include <algorithm>
#include <cctype>
#include <boost/algorithm/string.hpp>

using namespace parser;

using namespace std;
using namespace boost::algorithm;


static bool isNameChar(char c) {
    return isalnum(c) || c == '_' || c == '.';
}


PreconditionParser::PreconditionParser(const std::set<std::string> &bindings)
 : bindings(bindings)
{}


Precondition PreconditionParser::parse(const std::string &s) {
    debugParser("Now parsing precondition: " << s);
    toParseReversed = s;
    std::reverse(toParseReversed.begin(), toParseReversed.end());

    nextSymbol();
    Precondition res = disjunction();
    if (symbol != END) {
        throw UnexpectedSymbolException("Unexpected symbol after precondition: " + lastIdent);
    }
    return res;
}


char PreconditionParser::peek(size_t offset) const {
    if (offset >= toParseReversed.size()) {
        return '\0';
    }
    return toParseReversed[toParseReversed.size() - 1 - offset];
}


std::string PreconditionParser::readWhile(bool (*pred)(char)) {
    std::string res;
    while (!toParseReversed.empty() && pred(toParseReversed.back())) {
        res += toParseReversed.back();
        toParseReversed.pop_back();
    }
    return res;
}


void PreconditionParser::nextSymbol() {
    trim_right(toParseReversed);

    if (toParseReversed.empty()) {
        symbol = END;
        lastIdent = "end of text";
        return;
    }

    char nextChar = toParseReversed.back();
    bool signedLiteral = (nextChar == '-' || nextChar == '+')
            && (isdigit(peek(1)) || peek(1) == '.' || peek(1) == 'i');

    if (nextChar == '%') {
        toParseReversed.pop_back();
        lastIdent = "%" + readWhile(isNameChar);
        if (lastIdent.size() == 1) {
            throw UnknownSymbolException("Expected a name after %");
        }
        symbol = VALUE;
        debugParser("nextSymbol found value: " << lastIdent);

    } else if (isdigit(nextChar) || nextChar == '.' || signedLiteral) {
        lastIdent.clear();
        if (signedLiteral) {
            lastIdent += nextChar;
            toParseReversed.pop_back();
        }
        if (!toParseReversed.empty() && isalpha(toParseReversed.back())) {
            lastIdent += readWhile(isNameChar);
        } else {
            while (!toParseReversed.empty()) {
                char c = toParseReversed.back();
                bool exponentSign = (c == '-' || c == '+') && !lastIdent.empty()
                        && (lastIdent.back() == 'e' || lastIdent.back() == 'E');
                if (!(isdigit(c) || c == '.' || c == 'e' || c == 'E' || exponentSign)) {
                    break;
                }
                lastIdent += c;
                toParseReversed.pop_back();
            }
        }
        symbol = LITERAL;
        debugParser("nextSymbol found literal: " << lastIdent);

    } else if (isalpha(nextChar)) {
        lastIdent = readWhile(isNameChar);
        trim_right(toParseReversed);
        if (!toParseReversed.empty() && toParseReversed.back() == '(') {
            symbol = FUNCTIONSYMBOL;
            debugParser("nextSymbol found predicate: " << lastIdent);
        } else {
            symbol = WORD;
            debugParser("nextSymbol found word: " << lastIdent);
        }

    } else {
        toParseReversed.pop_back();
        lastIdent = string(1, nextChar);
        char following = toParseReversed.empty() ? '\0' : toParseReversed.back();

        if (nextChar == '&' || nextChar == '|') {
            if (following != nextChar) {
                throw UnknownSymbolException("Unknown symbol: " + lastIdent + ", did you mean " + lastIdent + lastIdent + "?");
            }
            toParseReversed.pop_back();
            symbol = nextChar == '&' ? AND : OR;

        } else if (nextChar == '!') {
            if (following == '=') {
                toParseReversed.pop_back();
                symbol = RELATION;
                lastRelation = Comparison::Neq;
            } else {
                symbol = NOT;
            }

        } else if (nextChar == '=') {
            if (following != '=') {
                throw UnknownSymbolException("Unknown symbol: =, did you mean ==?");
            }
            toParseReversed.pop_back();
            symbol = RELATION;
            lastRelation = Comparison::Eq;

        } else if (nextChar == '<' || nextChar == '>') {
            bool orEqual = following == '=';
            if (orEqual) {
                toParseReversed.pop_back();
            }
            symbol = RELATION;
            if (nextChar == '<') {
                lastRelation = orEqual ? Comparison::Le : Comparison::Lt;
            } else {
                lastRelation = orEqual ? Comparison::Ge : Comparison::Gt;
            }

        } else if (nextChar == '(') {
            symbol = LPAREN;

        } else if (nextChar == ')') {
            symbol = RPAREN;

        } else if (nextChar == ',') {
            symbol = COMMA;

        } else {
            throw UnknownSymbolException("Unknown symbol: " + lastIdent);
        }

        debugParser("[nextSymbol] found symbol " << lastIdent);
    }
}


bool PreconditionParser::accept(Symbol sym) {
    if (sym == symbol) {
        nextSymbol();
        return true;

    } else {
        return false;
    }
}


bool PreconditionParser::expect(Symbol sym) {
    if (accept(sym)) {
        return true;
    } else {
        throw UnexpectedSymbolException("Unexpected symbol: " + lastIdent);
    }
}


Precondition PreconditionParser::disjunction() {
    std::vector<Precondition> args = {conjunction()};
    while (accept(OR)) {
        args.push_back(conjunction());
    }
    return Pre::buildOr(args);
}


Precondition PreconditionParser::conjunction() {
    std::vector<Precondition> args = {unary()};
    while (accept(AND)) {
        args.push_back(unary());
    }
    return Pre::buildAnd(args);
}


Precondition PreconditionParser::unary() {
    if (accept(NOT)) {
        return !unary();
    }
    return atom();
}


Precondition PreconditionParser::atom() {
    if (accept(LPAREN)) {
        Precondition res = disjunction();
        expect(RPAREN);
        return res;
    }

    if (symbol == FUNCTIONSYMBOL) {
        string name = lastIdent;
        debugParser("parsing predicate " << name);
        nextSymbol();
        expect(LPAREN);

        vector<Operand> args;

        // check for empty argument list
        if (!accept(RPAREN)) {
            do {
                args.push_back(operand());
            } while (accept(COMMA));

            expect(RPAREN);
        }

        return Pre::predicate(name, args);
    }

    Operand lhs = operand();
    if (symbol == RELATION) {
        Comparison::Relation rel = lastRelation;
        nextSymbol();
        Operand rhs = operand();
        return Pre::compare(lhs, rel, rhs);
    }

    if (lhs.isLiteral() && lhs.getValue().isBoolean()) {
        return std::make_shared<PreConst>(classify(lhs.getValue()) == SymbolicFloat::True);
    }
    throw SyntaxErrorException("Expected a comparison, found: " + lastIdent);
}


Operand PreconditionParser::operand() {
    string ident = lastIdent;
    if (accept(VALUE)) {
        debugParser("parsing value " << ident);
        if (bindings.count(ident) > 0) {
            return Operand::binding(ident);
        }
        return Operand::input(ident);

    } else if (accept(WORD) || accept(LITERAL)) {
        if (Operand::isConstantName(ident)) {
            debugParser("parsing constant " << ident);
            return Operand::constant(ident);
        }
        option<SymbolicFloat> value = Operand::parseLiteral(ident);
        if (!value) {
            throw UnknownSymbolException("Unknown operand: " + ident);
        }
        debugParser("parsing literal " << ident);
        return Operand::literal(value.get());

    } else {
        throw SyntaxErrorException("Expected an operand, found: " + ident);
    }
}
