#include <gtest/gtest.h>

#include <sstream>

#include "parser/rulefile.hpp"

using rulefile::RuleFileParser;

namespace {

const std::string CorpusFile = std::string(FPRV_CORPUS_DIR) + "/fastmath.opt";

std::string str(const Corpus &corpus) {
    std::stringstream s;
    s << corpus;
    return s.str();
}

}

TEST(RuleFileTest, LoadsTheShippedCorpus) {
    Corpus corpus = RuleFileParser::loadFromFile(CorpusFile);
    EXPECT_EQ(22u, corpus.size());
    EXPECT_EQ(2u, corpus.disabledCount());
    EXPECT_EQ(20u, corpus.activeRules().size());
    for (const Rule &rule: corpus.getRules()) {
        EXPECT_NO_THROW(rule.validate()) << rule.getName();
    }

    option<Rule> rule = corpus.find("simplify:806");
    ASSERT_TRUE(rule);
    EXPECT_FALSE(Pre::isTrue(rule->getPrecondition()));
    EXPECT_EQ(Op::FAdd, rule->lhsRoot().getOpcode());
    EXPECT_EQ(Op::Copy, rule->rhsRoot().getOpcode());

    option<Rule> division = corpus.find("simplify:962");
    ASSERT_TRUE(division);
    EXPECT_EQ(FloatType::Half, division->pinnedType().get());

    ASSERT_TRUE(corpus.find("simplify:890"));
    EXPECT_TRUE(corpus.find("simplify:890")->isBidirectional());
}

TEST(RuleFileTest, KeepsDisabledRules) {
    Corpus corpus = RuleFileParser::loadFromFile(CorpusFile);
    option<Rule> rule = corpus.find("simplify:806-strict");
    ASSERT_TRUE(rule);
    EXPECT_FALSE(rule->isActive());
    EXPECT_EQ("-0.0 + 0.0 is +0.0", rule->getReason());
    EXPECT_EQ(Op::FAdd, rule->lhsRoot().getOpcode());

    Corpus all = corpus.enableAll();
    EXPECT_EQ(0u, all.disabledCount());
    EXPECT_EQ(22u, all.activeRules().size());
}

TEST(RuleFileTest, PrintedCorpusReadsBack) {
    Corpus corpus = RuleFileParser::loadFromFile(CorpusFile);
    std::string printed = str(corpus);
    Corpus again = RuleFileParser::loadFromString(printed);
    EXPECT_EQ(corpus.size(), again.size());
    EXPECT_EQ(corpus.disabledCount(), again.disabledCount());
    EXPECT_EQ(printed, str(again));
}

TEST(RuleFileTest, Instructions) {
    Corpus corpus = RuleFileParser::loadFromString(
            "Name: cmp\n"
            "%t = fsub fast %x, C1\n"
            "%r = fcmp nnan uno %t, %y\n"
            "  =>\n"
            "%r = false\n");
    ASSERT_EQ(1u, corpus.size());
    const Rule &rule = corpus.getRules().front();
    EXPECT_NO_THROW(rule.validate());
    ASSERT_EQ(2u, rule.getLhs().size());
    EXPECT_TRUE(rule.getLhs()[0].getFlags().isFast());
    EXPECT_TRUE(rule.getLhs()[0].getOperands()[1].isConstant());
    EXPECT_EQ(Op::FCmp, rule.lhsRoot().getOpcode());
    EXPECT_EQ(Op::UNO, rule.lhsRoot().getPredicate());
    EXPECT_TRUE(rule.lhsRoot().getFlags().has(FlagSet::NoNaNs));
    EXPECT_TRUE(rule.lhsRoot().getOperands()[0].isBinding());
    EXPECT_TRUE(rule.rhsRoot().isBoolean());
}

TEST(RuleFileTest, MalformedRulesAreKept) {
    Corpus corpus = RuleFileParser::loadFromString(
            "Name: unknown-opcode\n"
            "%r = fmadd %x, %y\n"
            "  =>\n"
            "%r = %x\n"
            "\n"
            "Name: bad-precondition\n"
            "Pre: C ==\n"
            "%r = fadd %x, C\n"
            "  =>\n"
            "%r = %x\n"
            "\n"
            "Name: no-arrow\n"
            "%r = fadd %x, 0.0\n"
            "\n"
            "Name: fine\n"
            "%r = fadd %x, -0.0\n"
            "  =>\n"
            "%r = %x\n");
    ASSERT_EQ(4u, corpus.size());
    EXPECT_TRUE(corpus.getRules()[0].isMalformed());
    EXPECT_TRUE(corpus.getRules()[1].isMalformed());
    EXPECT_TRUE(corpus.getRules()[2].isMalformed());
    EXPECT_THROW(corpus.getRules()[0].validate(), MalformedRule);
    EXPECT_FALSE(corpus.getRules()[3].isMalformed());
    EXPECT_NO_THROW(corpus.getRules()[3].validate());
}

TEST(RuleFileTest, SyntaxErrors) {
    try {
        RuleFileParser::loadFromString("; rules\n%r = fadd %x, 0.0\n");
        FAIL() << "expected a syntax error";
    } catch (const rulefile::RuleSyntaxError &e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("line 2"));
    }
    EXPECT_THROW(RuleFileParser::loadFromFile("/nonexistent/rules.opt"), rulefile::RuleFileError);
}
