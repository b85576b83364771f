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

#include "rulefile.hpp"
#include "../precondition/preconditionparser.hpp"
#include "../debug.hpp"

#include <fstream>
#include <sstream>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string.hpp>

namespace rulefile {

    Corpus RuleFileParser::loadFromFile(const std::string &filename) {
        std::ifstream ifs(filename);
        if (!ifs) {
            throw RuleFileError("Cannot read rule file " + filename);
        }
        RuleFileParser parser;
        parser.run(ifs);
        return parser.res;
    }

    Corpus RuleFileParser::loadFromString(const std::string &text) {
        std::istringstream in(text);
        RuleFileParser parser;
        parser.run(in);
        return parser.res;
    }

    void RuleFileParser::run(std::istream &in) {
        std::string line;
        unsigned int lineNo = 0;
        bool inDisabled = false;
        std::string reason;
        while (getline(in, line)) {
            ++lineNo;
            std::string content = boost::algorithm::trim_copy(line);
            bool commented = boost::starts_with(content, COMMENT);
            if (commented) {
                content = trim(content, COMMENT);
                if (boost::starts_with(content, DISABLED)) {
                    finishBlock();
                    inDisabled = true;
                    reason = trim(content, DISABLED);
                    continue;
                }
                if (!inDisabled) {
                    continue;
                }
            } else {
                inDisabled = false;
            }
            if (content.empty()) {
                continue;
            }
            if (boost::starts_with(content, NAME)) {
                finishBlock();
                Block block;
                block.name = trim(content, NAME);
                block.line = lineNo;
                block.disabled = commented;
                block.reason = commented ? reason : "";
                current = block;
                debugParser("found rule " << block.name << " in line " << lineNo);
                continue;
            }
            if (!current || current->disabled != commented) {
                throw RuleSyntaxError("line " + std::to_string(lineNo) + ": expected " + NAME + " before " + content);
            }
            current->lines.emplace_back(lineNo, content);
        }
        finishBlock();
    }

    void RuleFileParser::finishBlock() {
        if (!current) {
            return;
        }
        option<Rule> rule;
        try {
            rule = parseRule(current.get());
        } catch (const MalformedRule &e) {
            debugParser("rule " << current->name << " is malformed: " << e.what());
            rule = Rule::malformed(current->name, e.what());
        }
        if (current->disabled) {
            rule = rule->disable(current->reason);
        }
        res.add(rule.get());
        current = {};
    }

    Rule RuleFileParser::parseRule(const Block &block) const {
        std::string preText;
        option<FloatType::Type> type;
        std::vector<Instruction> lhs;
        std::vector<Instruction> rhs;
        std::set<std::string> lhsBindings;
        std::set<std::string> rhsBindings;
        bool seenArrow = false;
        bool bidirectional = false;
        for (const auto &p: block.lines) {
            const std::string &str = p.second;
            try {
                if (boost::starts_with(str, PRE)) {
                    preText = trim(str, PRE);
                } else if (boost::starts_with(str, TYPE)) {
                    std::string name = trim(str, TYPE);
                    type = FloatType::parse(name);
                    if (!type) {
                        throw MalformedRule("unknown type " + name);
                    }
                } else if (str == ARROW || str == BIARROW) {
                    if (seenArrow) {
                        throw MalformedRule("more than one " + ARROW);
                    }
                    seenArrow = true;
                    bidirectional = str == BIARROW;
                } else if (seenArrow) {
                    rhs.push_back(parseInstruction(str, rhsBindings));
                    rhsBindings.insert(rhs.back().getResult());
                } else {
                    lhs.push_back(parseInstruction(str, lhsBindings));
                    lhsBindings.insert(lhs.back().getResult());
                }
            } catch (const MalformedRule &e) {
                throw MalformedRule("line " + std::to_string(p.first) + ": " + e.what());
            }
        }
        if (!seenArrow) {
            throw MalformedRule("line " + std::to_string(block.line) + ": missing " + ARROW);
        }

        Precondition pre = Pre::True;
        if (!preText.empty()) {
            try {
                parser::PreconditionParser preParser(lhsBindings);
                pre = preParser.parse(preText);
            } catch (const parser::PreconditionParser::PreconditionParserException &e) {
                throw MalformedRule("cannot parse precondition " + preText + ": " + e.what());
            }
        }
        return Rule(block.name, pre, lhs, rhs, bidirectional, type);
    }

    Instruction RuleFileParser::parseInstruction(const std::string &str, const std::set<std::string> &bindings) const {
        size_t pos = str.find(ASSIGN);
        if (pos == std::string::npos) {
            throw MalformedRule("expected an instruction, found " + str);
        }
        std::string result = boost::algorithm::trim_copy(str.substr(0, pos));
        std::string def = boost::algorithm::trim_copy(str.substr(pos + ASSIGN.size()));
        if (result.size() < 2 || result[0] != '%') {
            throw MalformedRule("expected a %-name as result, found " + result);
        }
        if (def.empty()) {
            throw MalformedRule("missing definition of " + result);
        }

        std::vector<std::string> parts;
        boost::split(parts, def, boost::is_any_of(","));
        for (std::string &part: parts) {
            boost::algorithm::trim(part);
        }
        std::vector<std::string> words;
        boost::split(words, parts.front(), boost::is_space(), boost::token_compress_on);

        option<Op::Opcode> op = Op::parseOpcode(words.front());
        if (!op) {
            if (parts.size() == 1 && words.size() == 1) {
                return Instruction::copy(result, parseOperand(words.front(), bindings));
            }
            throw MalformedRule("unknown opcode " + words.front());
        }
        if (words.size() < 2) {
            throw MalformedRule("missing operands of " + words.front());
        }

        FlagSet flags;
        option<Op::Predicate> pred;
        option<FloatType::Type> type;
        for (size_t i = 1; i + 1 < words.size(); ++i) {
            const std::string &word = words[i];
            if (!pred && !type && flags.insert(word)) {
                continue;
            }
            if (op.get() == Op::FCmp && !pred && !type) {
                pred = Op::parsePredicate(word);
                if (pred) {
                    continue;
                }
            }
            if (!type) {
                type = FloatType::parse(word);
                if (type) {
                    continue;
                }
            }
            throw MalformedRule("unexpected " + word + " in " + Op::name(op.get()));
        }
        if (op.get() == Op::FCmp && !pred) {
            throw MalformedRule("fcmp needs a predicate");
        }

        std::vector<Operand> operands = {parseOperand(words.back(), bindings)};
        for (size_t i = 1; i < parts.size(); ++i) {
            operands.push_back(parseOperand(parts[i], bindings));
        }

        if (op.get() == Op::FCmp) {
            return Instruction::compare(result, pred.get(), operands, flags, type);
        }
        return Instruction(result, op.get(), operands, flags, type);
    }

    Operand RuleFileParser::parseOperand(const std::string &str, const std::set<std::string> &bindings) const {
        if (str.empty()) {
            throw MalformedRule("missing operand");
        }
        if (str[0] == '%') {
            if (str.size() < 2) {
                throw MalformedRule("expected a name after %");
            }
            return bindings.count(str) > 0 ? Operand::binding(str) : Operand::input(str);
        }
        if (Operand::isConstantName(str)) {
            return Operand::constant(str);
        }
        option<SymbolicFloat> value = Operand::parseLiteral(str);
        if (!value) {
            throw MalformedRule("unknown operand " + str);
        }
        return Operand::literal(value.get());
    }

    std::string RuleFileParser::trim(const std::string &str, const std::string &prefix) {
        std::string res = str;
        while (boost::starts_with(res, prefix)) {
            res = res.substr(prefix.size());
            boost::algorithm::trim_left(res);
        }
        boost::algorithm::trim(res);
        return res;
    }

}
