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

#ifndef FPRV_PRECONDITIONPARSER_HPP
#define FPRV_PRECONDITIONPARSER_HPP

#include <set>
#include <string>

#include "precondition.hpp"
#include "../exceptions.hpp"

namespace parser {

/**
 * A simple recursive descent parser for preconditions such as
 *   hasNSZ(%r) || CannotBeNegativeZero(%x)
 *   C == 0.0 && !(C1 < C2)
 *
 * && binds stronger than ||, ! binds strongest.
 */
class PreconditionParser {
public:
    EXCEPTION(PreconditionParserException, CustomException);

    EXCEPTION(UnexpectedSymbolException, PreconditionParserException);
    EXCEPTION(UnknownSymbolException, PreconditionParserException);
    EXCEPTION(UnexpectedEndOfTextException, PreconditionParserException);
    EXCEPTION(SyntaxErrorException, PreconditionParserException);

    /**
     * Create a PreconditionParser instance
     * @param bindings The names of the lhs instruction results, other %-names are inputs
     */
    PreconditionParser(const std::set<std::string> &bindings);

    /**
     * Tries to parse the given string into a precondition. Throws exception on failure.
     * It is safe to call this method several times on a single PreconditionParser instance.
     */
    Precondition parse(const std::string &s);

private:
    enum Symbol {
        LITERAL,
        WORD,
        VALUE,
        FUNCTIONSYMBOL,
        AND,
        OR,
        NOT,
        RELATION,
        LPAREN,
        RPAREN,
        COMMA,
        END
    };

    void nextSymbol();
    bool accept(Symbol sym);
    bool expect(Symbol sym);
    char peek(size_t offset) const;
    std::string readWhile(bool (*pred)(char));

    Precondition disjunction();
    Precondition conjunction();
    Precondition unary();
    Precondition atom();
    Operand operand();

    // settings
    const std::set<std::string> &bindings;

    // parser state
    std::string toParseReversed;
    std::string lastIdent;
    Comparison::Relation lastRelation;
    Symbol symbol;
};

}

#endif // FPRV_PRECONDITIONPARSER_HPP
