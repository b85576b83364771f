#include <gtest/gtest.h>

#include <limits>
#include <sstream>

#include "value/symbolicfloat.hpp"

namespace {

std::string str(const SymbolicFloat &v) {
    std::stringstream s;
    s << v;
    return s.str();
}

}

TEST(SymbolicFloatTest, ClassifiesLiterals) {
    EXPECT_EQ(SymbolicFloat::PosZero, classify(SymbolicFloat::literal(0.0)));
    EXPECT_EQ(SymbolicFloat::NegZero, classify(SymbolicFloat::literal(-0.0)));
    EXPECT_EQ(SymbolicFloat::Finite, classify(SymbolicFloat::literal(1.5)));
    EXPECT_EQ(SymbolicFloat::NegInfinity, classify(SymbolicFloat::literal(-std::numeric_limits<double>::infinity())));
    EXPECT_EQ(SymbolicFloat::NaN, classify(SymbolicFloat::literal(std::numeric_limits<double>::quiet_NaN())));
    EXPECT_EQ(SymbolicFloat::True, classify(SymbolicFloat::boolean(true)));

    EXPECT_TRUE(isSignedZero(SymbolicFloat::negZero()));
    EXPECT_FALSE(isSignedZero(SymbolicFloat::posZero()));
    EXPECT_TRUE(isZero(SymbolicFloat::posZero()));
    EXPECT_TRUE(isInfinite(SymbolicFloat::infinity(false)));
    EXPECT_TRUE(isNaN(SymbolicFloat::nan()));
    EXPECT_FALSE(isNaN(SymbolicFloat::undefined()));
}

TEST(SymbolicFloatTest, ClassifyRejectsAbstractValues) {
    EXPECT_THROW(classify(SymbolicFloat::variable("%x")), NotConcrete);
    EXPECT_THROW(classify(SymbolicFloat::undefined()), NotConcrete);
    EXPECT_THROW(classify(SymbolicFloat::poison()), NotConcrete);
}

TEST(SymbolicFloatTest, EverythingRefinesPoison) {
    EXPECT_TRUE(refines(SymbolicFloat::poison(), SymbolicFloat::posZero()));
    EXPECT_TRUE(refines(SymbolicFloat::poison(), SymbolicFloat::undefined()));
    EXPECT_TRUE(refines(SymbolicFloat::poison(), SymbolicFloat::poison()));
    EXPECT_FALSE(refines(SymbolicFloat::posZero(), SymbolicFloat::poison()));
    EXPECT_FALSE(refines(SymbolicFloat::undefined(), SymbolicFloat::poison()));
}

TEST(SymbolicFloatTest, RefinementOfUndefinedValues) {
    SymbolicFloat zeros = SymbolicFloat::undefined({SymbolicFloat::PosZero, SymbolicFloat::NegZero});
    EXPECT_TRUE(refines(zeros, SymbolicFloat::negZero()));
    EXPECT_TRUE(refines(zeros, SymbolicFloat::undefined({SymbolicFloat::PosZero})));
    EXPECT_FALSE(refines(zeros, SymbolicFloat::literal(1.0)));
    EXPECT_FALSE(refines(zeros, SymbolicFloat::undefined()));
    EXPECT_TRUE(refines(SymbolicFloat::undefined(), zeros));

    // a single value class is as good as the literal, finite values are not
    EXPECT_TRUE(refines(SymbolicFloat::nan(), SymbolicFloat::undefined({SymbolicFloat::NaN})));
    EXPECT_FALSE(refines(SymbolicFloat::literal(2.0), SymbolicFloat::undefined({SymbolicFloat::Finite})));
    EXPECT_FALSE(refines(SymbolicFloat::posZero(), zeros));
}

TEST(SymbolicFloatTest, RefinementOfLiterals) {
    EXPECT_TRUE(refines(SymbolicFloat::nan(), SymbolicFloat::nan()));
    EXPECT_TRUE(refines(SymbolicFloat::literal(2.5), SymbolicFloat::literal(2.5)));
    EXPECT_FALSE(refines(SymbolicFloat::literal(2.5), SymbolicFloat::literal(3.0)));
    EXPECT_FALSE(refines(SymbolicFloat::negZero(), SymbolicFloat::posZero()));
    EXPECT_FALSE(refines(SymbolicFloat::nan(), SymbolicFloat::literal(0.0)));
    EXPECT_TRUE(refines(SymbolicFloat::boolean(false), SymbolicFloat::boolean(false)));
    EXPECT_FALSE(refines(SymbolicFloat::boolean(false), SymbolicFloat::boolean(true)));
}

TEST(SymbolicFloatTest, VariablesAreNotConcrete) {
    EXPECT_THROW(refines(SymbolicFloat::variable("%x"), SymbolicFloat::nan()), NotConcrete);
    EXPECT_THROW(refines(SymbolicFloat::nan(), SymbolicFloat::variable("C")), NotConcrete);
}

TEST(SymbolicFloatTest, Printing) {
    EXPECT_EQ("-0.0", str(SymbolicFloat::negZero()));
    EXPECT_EQ("+inf", str(SymbolicFloat::infinity(false)));
    EXPECT_EQ("nan", str(SymbolicFloat::nan()));
    EXPECT_EQ("undef", str(SymbolicFloat::undefined()));
    EXPECT_EQ("undef{+0.0,-0.0}", str(SymbolicFloat::undefined({SymbolicFloat::PosZero, SymbolicFloat::NegZero})));
    EXPECT_EQ("poison", str(SymbolicFloat::poison()));
    EXPECT_EQ("1.5", str(SymbolicFloat::literal(1.5)));
}
