#include <gtest/gtest.h>

#include "config.hpp"
#include "parser/rulefile.hpp"
#include "verify/checker.hpp"

using rulefile::RuleFileParser;

namespace {

const std::string CorpusFile = std::string(FPRV_CORPUS_DIR) + "/fastmath.opt";

bool hasWarning(const VerificationResult &res, const std::string &part) {
    for (const std::string &w: res.getWarnings()) {
        if (w.find(part) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}

class CheckerTest : public ::testing::Test {
protected:
    void SetUp() override {
        types = Config::Verify::Types;
        undef = Config::Verify::UndefInputs;
        poison = Config::Verify::PoisonInputs;
        Config::Verify::Types = {FloatType::Half};
        corpus = RuleFileParser::loadFromFile(CorpusFile);
    }

    void TearDown() override {
        Config::Verify::Types = types;
        Config::Verify::UndefInputs = undef;
        Config::Verify::PoisonInputs = poison;
    }

    Rule shipped(const std::string &name) const {
        option<Rule> rule = corpus.find(name);
        if (!rule) {
            throw std::invalid_argument("no rule " + name);
        }
        return rule.get();
    }

    static Rule parse(const std::string &text) {
        return RuleFileParser::loadFromString(text).getRules().front();
    }

    Corpus corpus;
    std::vector<FloatType::Type> types;
    bool undef = true;
    bool poison = true;
};

TEST_F(CheckerTest, AddingZeroNeedsItsGuard) {
    VerificationResult res = Checker::verify(shipped("simplify:806"));
    EXPECT_TRUE(res.isProved()) << res;
    EXPECT_TRUE(res.getWarnings().empty());

    VerificationResult unguarded = Checker::verify(shipped("simplify:806").withPrecondition(Pre::True));
    ASSERT_TRUE(unguarded.isDisproved()) << unguarded;
    const Counterexample &cex = unguarded.getCounterexample().get();
    EXPECT_EQ(SymbolicFloat::negZero(), cex.value("%x").get());
    ASSERT_TRUE(cex.source && cex.target);
    EXPECT_EQ(SymbolicFloat::posZero(), cex.source.get());
    EXPECT_EQ(SymbolicFloat::negZero(), cex.target.get());
}

TEST_F(CheckerTest, EachDisjunctOfTheGuardSuffices) {
    EXPECT_TRUE(Checker::verify(parse("Name: nsz\nPre: hasNSZ(%r)\n%r = fadd %x, 0.0\n=>\n%r = %x\n")).isProved());
    EXPECT_TRUE(Checker::verify(parse("Name: analysis\nPre: CannotBeNegativeZero(%x)\n%r = fadd %x, 0.0\n=>\n%r = %x\n")).isProved());
    EXPECT_TRUE(Checker::verify(parse("Name: written\n%r = fadd nsz %x, 0.0\n=>\n%r = %x\n")).isProved());
}

TEST_F(CheckerTest, SubtractingItselfNeedsNnan) {
    EXPECT_TRUE(Checker::verify(shipped("simplify:859")).isProved());

    VerificationResult strict = Checker::verify(shipped("simplify:859").withoutFlag(0, FlagSet::NoNaNs));
    ASSERT_TRUE(strict.isDisproved()) << strict;
    const Counterexample &cex = strict.getCounterexample().get();
    SymbolicFloat x = cex.value("%x").get();
    EXPECT_TRUE(isNaN(x) || isInfinite(x)) << x;
    ASSERT_TRUE(cex.source);
    EXPECT_TRUE(isNaN(cex.source.get()));
    EXPECT_EQ(SymbolicFloat::posZero(), cex.target.get());
}

TEST_F(CheckerTest, DividingZeroNeedsNsz) {
    EXPECT_TRUE(Checker::verify(shipped("simplify:962")).isProved());

    VerificationResult res = Checker::verify(shipped("simplify:962").withoutFlag(0, FlagSet::NoSignedZeros));
    ASSERT_TRUE(res.isDisproved()) << res;
    const Counterexample &cex = res.getCounterexample().get();
    EXPECT_EQ(FloatType::Half, cex.type);
    ASSERT_TRUE(cex.source && cex.target);
    EXPECT_TRUE(isZero(cex.source.get()));
    EXPECT_TRUE(isZero(cex.target.get()));
    EXPECT_NE(cex.source.get(), cex.target.get());
}

TEST_F(CheckerTest, RemainderReportsTheUnneededFlag) {
    VerificationResult res = Checker::verify(shipped("simplify:1030"));
    ASSERT_TRUE(res.isProved()) << res;
    ASSERT_EQ(1u, res.getWarnings().size());
    EXPECT_EQ("flag nsz of %r is not needed", res.getWarnings().front());

    EXPECT_TRUE(Checker::verify(shipped("simplify:1030").withoutFlag(0, FlagSet::NoSignedZeros)).isProved());
    EXPECT_TRUE(Checker::verify(shipped("simplify:1030").withoutFlag(0, FlagSet::NoNaNs)).isDisproved());
}

TEST_F(CheckerTest, FastIsCheckedFlagByFlag) {
    Rule rule = parse("Name: fast\n%r = fsub fast %x, %x\n=>\n%r = 0.0\n");
    VerificationResult res = Checker::verify(rule);
    ASSERT_TRUE(res.isProved()) << res;
    ASSERT_EQ(2u, res.getWarnings().size());
    EXPECT_EQ("flag ninf of %r is not needed", res.getWarnings()[0]);
    EXPECT_EQ("flag nsz of %r is not needed", res.getWarnings()[1]);

    VerificationResult strict = Checker::verify(rule.withoutFlag(0, FlagSet::NoNaNs));
    ASSERT_TRUE(strict.isDisproved()) << strict;
    EXPECT_TRUE(isNaN(strict.getCounterexample()->value("%x").get()));
}

TEST_F(CheckerTest, ComparisonsMayBecomePoisonOrUndef) {
    VerificationResult poison = Checker::verify(parse("Name: p\n%r = fcmp nnan oeq %x, nan\n=>\n%r = poison\n"));
    EXPECT_TRUE(poison.isProved()) << poison;

    VerificationResult undef = Checker::verify(parse("Name: u\n%r = fcmp nnan uno %x, nan\n=>\n%r = undef\n"));
    EXPECT_TRUE(undef.isProved()) << undef;

    VerificationResult defined = Checker::verify(parse("Name: d\n%r = fcmp ord %x, %x\n=>\n%r = poison\n"));
    ASSERT_TRUE(defined.isDisproved()) << defined;
    EXPECT_TRUE(defined.getCounterexample()->target->isPoison());
}

TEST_F(CheckerTest, Comparisons) {
    for (const std::string &name: {"simplify:2110", "simplify:2114", "simplify:2118", "simplify:2122", "simplify:2126",
                                   "simplify:2130", "simplify:2150", "simplify:2154", "simplify:2170", "simplify:2174"}) {
        VerificationResult res = Checker::verify(shipped(name));
        EXPECT_TRUE(res.isProved()) << name << ": " << res;
    }
    VerificationResult ordered = Checker::verify(parse("Name: oeq\n%r = fcmp oeq %x, %x\n=>\n%r = true\n"));
    ASSERT_TRUE(ordered.isDisproved());
    EXPECT_TRUE(isNaN(ordered.getCounterexample()->value("%x").get()));
}

TEST_F(CheckerTest, BidirectionalRules) {
    EXPECT_TRUE(Checker::verify(shipped("simplify:890")).isProved());

    VerificationResult res = Checker::verify(parse("Name: both\n%r = fmul nnan nsz %x, 0.0\n<=>\n%r = 0.0\n"));
    ASSERT_TRUE(res.isDisproved()) << res;
    const Counterexample &cex = res.getCounterexample().get();
    EXPECT_TRUE(cex.converse);
    ASSERT_TRUE(cex.source && cex.target);
    EXPECT_FALSE(refines(cex.source.get(), cex.target.get())) << cex;
}

TEST_F(CheckerTest, VacuousPrecondition) {
    VerificationResult res = Checker::verify(parse("Name: never\nPre: C == 0.0 && C != 0.0\n%r = fadd %x, C\n=>\n%r = %x\n"));
    ASSERT_TRUE(res.isProved()) << res;
    EXPECT_TRUE(hasWarning(res, "unsatisfiable"));
}

TEST_F(CheckerTest, MalformedRules) {
    VerificationResult unbound = Checker::verify(parse("Name: unbound\n%r = fadd %x, 0.0\n=>\n%r = %y\n"));
    EXPECT_EQ(VerificationResult::Malformed, unbound.getOutcome());

    VerificationResult predicate = Checker::verify(parse("Name: pred\nPre: isPositive(%x)\n%r = fadd %x, 0.0\n=>\n%r = %x\n"));
    EXPECT_EQ(VerificationResult::Malformed, predicate.getOutcome());

    VerificationResult opcode = Checker::verify(parse("Name: op\n%r = fmadd %x, 0.0\n=>\n%r = %x\n"));
    EXPECT_EQ(VerificationResult::Malformed, opcode.getOutcome());
    EXPECT_FALSE(opcode.getReason().empty());
}

TEST_F(CheckerTest, UnboundPreconditionNames) {
    VerificationResult flag = Checker::verify(parse("Name: flag\nPre: hasNSZ(%q)\n%r = fadd %x, 0.0\n=>\n%r = %x\n"));
    EXPECT_EQ(VerificationResult::Unknown, flag.getOutcome());

    VerificationResult constant = Checker::verify(parse("Name: const\nPre: C == 0.0\n%r = fadd %x, 0.0\n=>\n%r = %x\n"));
    EXPECT_EQ(VerificationResult::Unknown, constant.getOutcome());
}

TEST_F(CheckerTest, UndefInputs) {
    // every use of an undef input may differ, so x + x can take values 2 * x cannot
    Rule rule = parse("Name: double\n%r = fmul %x, 2.0\n=>\n%r = fadd %x, %x\n");
    VerificationResult res = Checker::verify(rule);
    EXPECT_FALSE(res.isProved()) << res;
    if (res.isDisproved()) {
        EXPECT_TRUE(res.getCounterexample()->value("%x")->isUndefined());
    }

    Config::Verify::UndefInputs = false;
    EXPECT_TRUE(Checker::verify(rule).isProved());
}

TEST_F(CheckerTest, PoisonInputs) {
    Rule widening = parse("Name: widening\n%r = fcmp true %x, %y\n=>\n%r = fcmp true %x, %x\n");
    EXPECT_TRUE(Checker::verify(widening).isProved());

    Rule narrowing = parse("Name: narrowing\n%t = fadd %y, 0.0\n%r = fcmp true %x, %x\n=>\n%r = fcmp true %x, %y\n");
    VerificationResult res = Checker::verify(narrowing);
    ASSERT_TRUE(res.isDisproved()) << res;
    EXPECT_TRUE(res.getCounterexample()->value("%y")->isPoison());
    EXPECT_TRUE(res.getCounterexample()->target->isPoison());

    Config::Verify::PoisonInputs = false;
    EXPECT_TRUE(Checker::verify(narrowing).isProved());
}

TEST_F(CheckerTest, OldNszEncodingKeepsTheSignOfZero) {
    Config::FastMath::Encoding encoding = Config::FastMath::Semantics;
    EXPECT_TRUE(Checker::verify(shipped("simplify:898")).isProved());

    Config::FastMath::Semantics = Config::FastMath::OldNSZ;
    VerificationResult res = Checker::verify(shipped("simplify:898"));
    // the guard of simplify:806 covers -0.0 in either encoding
    VerificationResult guarded = Checker::verify(shipped("simplify:806"));
    Config::FastMath::Semantics = encoding;

    ASSERT_TRUE(res.isDisproved()) << res;
    const Counterexample &cex = res.getCounterexample().get();
    ASSERT_TRUE(cex.source);
    EXPECT_EQ(SymbolicFloat::negZero(), cex.source.get());
    EXPECT_TRUE(guarded.isProved()) << guarded;
}

namespace {

class OpaquePrecondition: public PreExpression {
public:
    void print(std::ostream &s) const override {
        s << "opaque";
    }
};

}

TEST_F(CheckerTest, InternalErrorsAreUnknown) {
    Precondition opaque = std::make_shared<OpaquePrecondition>();
    VerificationResult res = Checker::verify(shipped("simplify:801").withPrecondition(opaque));
    EXPECT_EQ(VerificationResult::Unknown, res.getOutcome());
    EXPECT_NE(std::string::npos, res.getReason().find("unknown precondition")) << res;
}
