#include <gtest/gtest.h>

#include <limits>

#include "config.hpp"
#include "semantics/semantics.hpp"

namespace {

const SymbolicFloat::ClassSet Zeros = {SymbolicFloat::PosZero, SymbolicFloat::NegZero};

FlagSet flags(std::initializer_list<FlagSet::Flag> fs) {
    FlagSet res;
    for (FlagSet::Flag f: fs) {
        res = res.with(f);
    }
    return res;
}

SymbolicFloat lit(double d) {
    return SymbolicFloat::literal(d);
}

const double inf = std::numeric_limits<double>::infinity();

}

TEST(SemanticsTest, AddingNegativeZeroIsIdentity) {
    for (double x: {0.0, -0.0, 1.0, -3.25, 1e300, -inf}) {
        SymbolicFloat res = Semantics::evaluate(Op::FAdd, {lit(x), SymbolicFloat::negZero()}, FlagSet());
        EXPECT_TRUE(refines(res, lit(x))) << "x = " << x;
    }
}

TEST(SemanticsTest, AddingPositiveZeroNeedsNsz) {
    SymbolicFloat strict = Semantics::evaluate(Op::FAdd, {SymbolicFloat::negZero(), SymbolicFloat::posZero()}, FlagSet());
    EXPECT_EQ(SymbolicFloat::posZero(), strict);
    EXPECT_FALSE(refines(strict, SymbolicFloat::negZero()));

    SymbolicFloat relaxed = Semantics::evaluate(Op::FAdd, {SymbolicFloat::negZero(), SymbolicFloat::posZero()},
                                                flags({FlagSet::NoSignedZeros}));
    EXPECT_TRUE(relaxed.isUndefined());
    EXPECT_EQ(Zeros, relaxed.possibleClasses());
    EXPECT_TRUE(refines(relaxed, SymbolicFloat::negZero()));

    EXPECT_EQ(lit(2.0), Semantics::evaluate(Op::FAdd, {lit(2.0), SymbolicFloat::posZero()}, FlagSet()));
}

TEST(SemanticsTest, MultiplyingByZero) {
    FlagSet fast = flags({FlagSet::NoNaNs, FlagSet::NoSignedZeros});
    for (double x: {0.0, -0.0, 7.0, -7.0, 1e-300}) {
        SymbolicFloat res = Semantics::evaluate(Op::FMul, {lit(x), SymbolicFloat::posZero()}, fast);
        EXPECT_EQ(Zeros, res.possibleClasses()) << "x = " << x;
        EXPECT_TRUE(refines(res, SymbolicFloat::posZero()));
    }
    SymbolicFloat strict = Semantics::evaluate(Op::FMul, {SymbolicFloat::nan(), SymbolicFloat::posZero()}, FlagSet());
    EXPECT_EQ(SymbolicFloat::nan(), strict);
    EXPECT_EQ(SymbolicFloat::negZero(), Semantics::evaluate(Op::FMul, {lit(-7.0), SymbolicFloat::posZero()}, FlagSet()));
}

TEST(SemanticsTest, DividingZeroInHalfPrecision) {
    FlagSet both = flags({FlagSet::NoNaNs, FlagSet::NoSignedZeros});
    SymbolicFloat res = Semantics::evaluate(Op::FDiv, {SymbolicFloat::posZero(), lit(-1.0)}, both, FloatType::Half);
    EXPECT_EQ(Zeros, res.possibleClasses());
    EXPECT_TRUE(refines(res, SymbolicFloat::posZero()));

    SymbolicFloat noNsz = Semantics::evaluate(Op::FDiv, {SymbolicFloat::posZero(), lit(-1.0)},
                                              flags({FlagSet::NoNaNs}), FloatType::Half);
    EXPECT_EQ(SymbolicFloat::negZero(), noNsz);
    EXPECT_FALSE(refines(noNsz, SymbolicFloat::posZero()));

    // 0 / 0 is NaN, which nnan turns into poison
    EXPECT_TRUE(Semantics::evaluate(Op::FDiv, {SymbolicFloat::posZero(), SymbolicFloat::posZero()}, both,
                                    FloatType::Half).isPoison());
}

TEST(SemanticsTest, RemainderKeepsTheSignOfZero) {
    FlagSet nnan = flags({FlagSet::NoNaNs});
    EXPECT_EQ(SymbolicFloat::negZero(), Semantics::evaluate(Op::FRem, {SymbolicFloat::negZero(), lit(3.0)}, nnan, FloatType::Half));
    EXPECT_EQ(SymbolicFloat::posZero(), Semantics::evaluate(Op::FRem, {SymbolicFloat::posZero(), lit(-inf)}, nnan, FloatType::Half));
    EXPECT_EQ(lit(1.0), Semantics::evaluate(Op::FRem, {lit(7.0), lit(3.0)}, FlagSet(), FloatType::Half));
    EXPECT_EQ(lit(-1.0), Semantics::evaluate(Op::FRem, {lit(5.0), lit(3.0)}, FlagSet(), FloatType::Half));
}

TEST(SemanticsTest, ReflexiveComparisons) {
    for (double x: {0.0, -0.0, 1.0, inf, std::numeric_limits<double>::quiet_NaN()}) {
        EXPECT_EQ(SymbolicFloat::boolean(true), Semantics::evaluate(Op::UEQ, {lit(x), lit(x)}, FlagSet())) << "x = " << x;
        EXPECT_EQ(SymbolicFloat::boolean(false), Semantics::evaluate(Op::ONE, {lit(x), lit(x)}, FlagSet())) << "x = " << x;
        EXPECT_EQ(SymbolicFloat::boolean(true), Semantics::evaluate(Op::UGE, {lit(x), lit(x)}, FlagSet()));
        EXPECT_EQ(SymbolicFloat::boolean(false), Semantics::evaluate(Op::OLT, {lit(x), lit(x)}, FlagSet()));
    }
}

TEST(SemanticsTest, ComparisonsWithNaN) {
    for (double x: {0.0, -2.0, inf}) {
        EXPECT_EQ(SymbolicFloat::boolean(false), Semantics::evaluate(Op::OEQ, {lit(x), SymbolicFloat::nan()}, FlagSet()));
        EXPECT_EQ(SymbolicFloat::boolean(true), Semantics::evaluate(Op::UNO, {lit(x), SymbolicFloat::nan()}, FlagSet()));
    }
    EXPECT_TRUE(Semantics::evaluate(Op::UNO, {lit(1.0), SymbolicFloat::nan()}, flags({FlagSet::NoNaNs})).isPoison());
    EXPECT_EQ(SymbolicFloat::boolean(true), Semantics::evaluate(Op::OEQ, {SymbolicFloat::negZero(), SymbolicFloat::posZero()}, FlagSet()));
}

TEST(SemanticsTest, PoisonPropagates) {
    for (Op::Opcode op: {Op::FAdd, Op::FSub, Op::FMul, Op::FDiv, Op::FRem}) {
        EXPECT_TRUE(Semantics::evaluate(op, {SymbolicFloat::poison(), lit(1.0)}, FlagSet()).isPoison()) << Op::name(op);
        EXPECT_TRUE(Semantics::evaluate(op, {lit(1.0), SymbolicFloat::poison()}, FlagSet::fastMath()).isPoison()) << Op::name(op);
    }
    EXPECT_TRUE(Semantics::evaluate(Op::PredTrue, {SymbolicFloat::poison(), lit(1.0)}, FlagSet()).isPoison());
}

TEST(SemanticsTest, InfinitiesWithNinf) {
    FlagSet ninf = flags({FlagSet::NoInfs});
    EXPECT_TRUE(Semantics::evaluate(Op::FAdd, {lit(inf), lit(1.0)}, ninf).isPoison());
    EXPECT_TRUE(Semantics::evaluate(Op::FMul, {lit(1e300), lit(1e300)}, ninf).isPoison());
    EXPECT_EQ(lit(2.0), Semantics::evaluate(Op::FAdd, {lit(1.0), lit(1.0)}, ninf));
    EXPECT_TRUE(Semantics::evaluate(Op::OLT, {lit(-inf), lit(1.0)}, ninf).isPoison());
}

TEST(SemanticsTest, UndefinedOperands) {
    SymbolicFloat res = Semantics::evaluate(Op::FMul, {SymbolicFloat::undefined(), SymbolicFloat::posZero()}, FlagSet());
    EXPECT_TRUE(res.isUndefined());
    EXPECT_EQ(SymbolicFloat::ClassSet({SymbolicFloat::PosZero, SymbolicFloat::NegZero, SymbolicFloat::NaN}), res.possibleClasses());

    SymbolicFloat copied = Semantics::evaluate(Op::Copy, {SymbolicFloat::undefined(Zeros)}, FlagSet());
    EXPECT_EQ(Zeros, copied.possibleClasses());
}

TEST(SemanticsTest, RoundsToTheType) {
    // 1 + 2^-11 is not representable in half precision, ties go to the even 1.0
    EXPECT_EQ(lit(1.0), Semantics::evaluate(Op::FAdd, {lit(1.0), lit(1.0 / 2048)}, FlagSet(), FloatType::Half));
    EXPECT_EQ(lit(1.0 + 1.0 / 2048), Semantics::evaluate(Op::FAdd, {lit(1.0), lit(1.0 / 2048)}, FlagSet(), FloatType::Double));
    EXPECT_EQ(SymbolicFloat::infinity(false), Semantics::evaluate(Op::FMul, {lit(256.0), lit(256.0)}, FlagSet(), FloatType::Half));
}

TEST(SemanticsTest, RejectsVariables) {
    EXPECT_THROW(Semantics::evaluate(Op::FAdd, {SymbolicFloat::variable("%x"), lit(1.0)}, FlagSet()), NotConcrete);
}

class FastMathEncodingTest : public ::testing::Test {
protected:
    void SetUp() override {
        encoding = Config::FastMath::Semantics;
    }

    void TearDown() override {
        Config::FastMath::Semantics = encoding;
    }

    Config::FastMath::Encoding encoding = Config::FastMath::Poison;
};

TEST_F(FastMathEncodingTest, ViolatedFlagsYieldUndef) {
    FlagSet nnan = flags({FlagSet::NoNaNs});
    EXPECT_TRUE(Semantics::evaluate(Op::FAdd, {SymbolicFloat::nan(), lit(1.0)}, nnan).isPoison());

    Config::FastMath::Semantics = Config::FastMath::Undef;
    SymbolicFloat res = Semantics::evaluate(Op::FAdd, {SymbolicFloat::nan(), lit(1.0)}, nnan);
    EXPECT_TRUE(res.isUndefined()) << res;
    EXPECT_EQ(SymbolicFloat::FloatClasses, res.possibleClasses());
    EXPECT_EQ(lit(2.0), Semantics::evaluate(Op::FAdd, {lit(1.0), lit(1.0)}, nnan));
}

TEST_F(FastMathEncodingTest, OldNszForbidsNegativeZeroOperands) {
    FlagSet nsz = flags({FlagSet::NoSignedZeros});
    Config::FastMath::Semantics = Config::FastMath::OldNSZ;
    EXPECT_TRUE(Semantics::evaluate(Op::FAdd, {SymbolicFloat::negZero(), SymbolicFloat::posZero()}, nsz).isPoison());
    // the sign of a zero result is kept
    EXPECT_EQ(SymbolicFloat::negZero(), Semantics::evaluate(Op::FMul, {lit(-7.0), SymbolicFloat::posZero()}, nsz));
}

TEST_F(FastMathEncodingTest, BrokenNszPoisonsZeroResults) {
    FlagSet nsz = flags({FlagSet::NoSignedZeros});
    Config::FastMath::Semantics = Config::FastMath::BrokenNSZ;
    EXPECT_TRUE(Semantics::evaluate(Op::FMul, {lit(-7.0), SymbolicFloat::posZero()}, nsz).isPoison());
    EXPECT_EQ(lit(6.0), Semantics::evaluate(Op::FMul, {lit(2.0), lit(3.0)}, nsz));
}
