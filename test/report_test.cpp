#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <thread>

#include "config.hpp"
#include "parser/rulefile.hpp"
#include "util/timeout.hpp"
#include "verify/report.hpp"

using rulefile::RuleFileParser;

class ReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        types = Config::Verify::Types;
        Config::Verify::Types = {FloatType::Half};
    }

    void TearDown() override {
        Config::Verify::Types = types;
        Timeout::setTimeouts(0);
    }

    std::vector<FloatType::Type> types;
};

namespace {

const std::string Rules =
        "Name: good\n"
        "%r = fadd %x, -0.0\n"
        "  =>\n"
        "%r = %x\n"
        "\n"
        "; Disabled: unsound\n"
        "; Name: off\n"
        "; %r = fadd %x, 0.0\n"
        ";   =>\n"
        "; %r = %x\n"
        "\n"
        "Name: bad\n"
        "%r = fadd %x, 0.0\n"
        "  =>\n"
        "%r = %x\n"
        "\n"
        "Name: broken\n"
        "%r = fadd %x, 0.0\n"
        "  =>\n"
        "%r = %y\n"
        "\n"
        "Name: cmp\n"
        "%r = fcmp ueq %x, %x\n"
        "  =>\n"
        "%r = true\n";

std::vector<std::string> names(const Report &report) {
    std::vector<std::string> res;
    for (const Report::Entry &e: report.getEntries()) {
        res.push_back(e.rule.getName());
    }
    return res;
}

}

TEST_F(ReportTest, ResultsInCorpusOrder) {
    Corpus corpus = RuleFileParser::loadFromString(Rules);
    Report report = Report::run(corpus, 3);

    EXPECT_EQ(std::vector<std::string>({"good", "bad", "broken", "cmp"}), names(report));
    EXPECT_EQ(1u, report.disabledCount());
    EXPECT_EQ(2u, report.count(VerificationResult::Proved));
    EXPECT_EQ(1u, report.count(VerificationResult::Disproved));
    EXPECT_EQ(1u, report.count(VerificationResult::Malformed));
    EXPECT_FALSE(report.success());

    std::stringstream s;
    s << report;
    std::string text = s.str();
    EXPECT_EQ(0u, text.find("good: PROVED\nbad: DISPROVED\nbroken: MALFORMED ("));
    EXPECT_NE(std::string::npos, text.find("4 rules checked: 2 proved, 1 disproved, 0 unknown, 1 malformed; 1 disabled"));
}

TEST_F(ReportTest, OneWorkerGivesTheSameResults) {
    Corpus corpus = RuleFileParser::loadFromString(Rules);
    Report parallel = Report::run(corpus, 4);
    Report sequential = Report::run(corpus, 1);
    ASSERT_EQ(parallel.getEntries().size(), sequential.getEntries().size());
    for (size_t i = 0; i < parallel.getEntries().size(); ++i) {
        EXPECT_EQ(parallel.getEntries()[i].rule.getName(), sequential.getEntries()[i].rule.getName());
        EXPECT_EQ(parallel.getEntries()[i].result.getOutcome(), sequential.getEntries()[i].result.getOutcome());
    }
}

TEST_F(ReportTest, SucceedsWithoutDisprovedRules) {
    Corpus corpus = RuleFileParser::loadFromString(Rules).restrict({"good", "cmp"});
    Report report = Report::run(corpus, 2);
    EXPECT_TRUE(report.success());
    EXPECT_EQ(2u, report.count(VerificationResult::Proved));
    EXPECT_EQ(0u, report.disabledCount());
}

TEST_F(ReportTest, CheckingDisabledRules) {
    Corpus corpus = RuleFileParser::loadFromString(Rules).enableAll().restrict({"off"});
    Report report = Report::run(corpus, 1);
    ASSERT_EQ(1u, report.getEntries().size());
    EXPECT_TRUE(report.getEntries().front().result.isDisproved());
}

TEST_F(ReportTest, RulesAfterTheTimeoutAreUnknown) {
    Corpus corpus = RuleFileParser::loadFromString(Rules);
    Timeout::setTimeouts(2);
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    Report report = Report::run(corpus, 2);
    for (const Report::Entry &e: report.getEntries()) {
        EXPECT_EQ(VerificationResult::Unknown, e.result.getOutcome()) << e.rule.getName();
        EXPECT_EQ("timeout", e.result.getReason());
    }
}

TEST_F(ReportTest, EmptyCorpus) {
    Report report = Report::run(Corpus(), 4);
    EXPECT_TRUE(report.getEntries().empty());
    EXPECT_TRUE(report.success());
}
