#include <gtest/gtest.h>

#include <sstream>

#include "rule/rule.hpp"

namespace {

Operand x = Operand::input("%x");
Operand y = Operand::input("%y");
Operand c = Operand::constant("C");
Operand zero = Operand::literal(SymbolicFloat::posZero());

Instruction fadd(const std::string &res, const Operand &a, const Operand &b, const FlagSet &flags = FlagSet()) {
    return Instruction(res, Op::FAdd, {a, b}, flags);
}

std::string str(const Instruction &instr) {
    std::stringstream s;
    s << instr;
    return s.str();
}

}

TEST(OperandTest, ParsesLiterals) {
    EXPECT_EQ(SymbolicFloat::negZero(), Operand::parseLiteral("-0.0").get());
    EXPECT_EQ(SymbolicFloat::literal(1500.0), Operand::parseLiteral("1.5e3").get());
    EXPECT_EQ(SymbolicFloat::infinity(true), Operand::parseLiteral("-inf").get());
    EXPECT_EQ(SymbolicFloat::infinity(false), Operand::parseLiteral("1e999").get());
    EXPECT_TRUE(Operand::parseLiteral("undef")->isUndefined());
    EXPECT_TRUE(Operand::parseLiteral("poison")->isPoison());
    EXPECT_EQ(SymbolicFloat::boolean(true), Operand::parseLiteral("true").get());
    EXPECT_FALSE(Operand::parseLiteral("1.0x"));
    EXPECT_FALSE(Operand::parseLiteral("%x"));

    EXPECT_TRUE(Operand::isConstantName("C"));
    EXPECT_TRUE(Operand::isConstantName("C12"));
    EXPECT_FALSE(Operand::isConstantName("Cx"));
}

TEST(InstructionTest, Printing) {
    EXPECT_EQ("%r = fadd nnan nsz %x, +0.0",
              str(fadd("%r", x, zero, FlagSet().with(FlagSet::NoNaNs).with(FlagSet::NoSignedZeros))));
    EXPECT_EQ("%r = fcmp ninf uno half %x, C",
              str(Instruction::compare("%r", Op::UNO, {x, c}, FlagSet().with(FlagSet::NoInfs), FloatType::Half)));
    EXPECT_EQ("%r = %x", str(Instruction::copy("%r", x)));
}

TEST(RuleTest, ValidRule) {
    Rule rule("r", Pre::True, {fadd("%r", x, zero)}, {Instruction::copy("%r", x)});
    EXPECT_NO_THROW(rule.validate());
    EXPECT_TRUE(rule.isActive());
    EXPECT_FALSE(rule.pinnedType());
}

TEST(RuleTest, RhsMustNotInventInputs) {
    Rule rule("r", Pre::True, {fadd("%r", x, zero)}, {Instruction::copy("%r", y)});
    EXPECT_THROW(rule.validate(), MalformedRule);
}

TEST(RuleTest, BindingsMustBeDefinedFirst) {
    Rule rule("r", Pre::True, {fadd("%r", Operand::binding("%t"), zero), fadd("%t", x, x)}, {Instruction::copy("%r", x)});
    EXPECT_THROW(rule.validate(), MalformedRule);

    Rule twice("r", Pre::True, {fadd("%r", x, zero), fadd("%r", x, x)}, {Instruction::copy("%r", x)});
    EXPECT_THROW(twice.validate(), MalformedRule);
}

TEST(RuleTest, ResultsMustAgree) {
    Rule otherName("r", Pre::True, {fadd("%r", x, zero)}, {Instruction::copy("%s", x)});
    EXPECT_THROW(otherName.validate(), MalformedRule);

    Rule otherType("r", Pre::True, {Instruction::compare("%r", Op::UEQ, {x, x})}, {Instruction::copy("%r", zero)});
    EXPECT_THROW(otherType.validate(), MalformedRule);

    Rule poisonResult("r", Pre::True, {Instruction::compare("%r", Op::OEQ, {x, x})},
                      {Instruction::copy("%r", Operand::literal(SymbolicFloat::poison()))});
    EXPECT_NO_THROW(poisonResult.validate());
    EXPECT_TRUE(poisonResult.isBoolean(poisonResult.getRhs(), "%r"));

    Rule undefResult("r", Pre::True, {Instruction::compare("%r", Op::OEQ, {x, x})},
                     {Instruction::copy("%t", Operand::literal(SymbolicFloat::undefined())),
                      Instruction::copy("%r", Operand::binding("%t"))});
    EXPECT_NO_THROW(undefResult.validate());

    Rule boolOperand("r", Pre::True, {Instruction::compare("%t", Op::UEQ, {x, x}), fadd("%r", Operand::binding("%t"), zero)},
                     {Instruction::copy("%r", x)});
    EXPECT_THROW(boolOperand.validate(), MalformedRule);
}

TEST(RuleTest, PinnedType) {
    Rule pinned("r", Pre::True, {Instruction("%r", Op::FDiv, {c, x}, FlagSet(), FloatType::Half)}, {Instruction::copy("%r", c)});
    EXPECT_EQ(FloatType::Half, pinned.pinnedType().get());

    Rule conflict("r", Pre::True, {Instruction("%r", Op::FDiv, {c, x}, FlagSet(), FloatType::Half)},
                  {Instruction::copy("%r", c)}, false, FloatType::Double);
    EXPECT_THROW(conflict.pinnedType(), MalformedRule);
    EXPECT_THROW(conflict.validate(), MalformedRule);
}

TEST(RuleTest, UnknownPredicateIsMalformed) {
    Rule rule("r", Pre::predicate("isPositive", {x}), {fadd("%r", x, zero)}, {Instruction::copy("%r", x)});
    EXPECT_THROW(rule.validate(), MalformedRule);
}

TEST(RuleTest, FreeVariablesInOrder) {
    Rule rule("r", Pre::True, {fadd("%t", c, x), fadd("%r", Operand::binding("%t"), y), fadd("%s", x, c)},
              {Instruction::copy("%s", x)});
    std::vector<Operand> free = rule.freeVariables();
    ASSERT_EQ(3u, free.size());
    EXPECT_EQ(c, free[0]);
    EXPECT_EQ(x, free[1]);
    EXPECT_EQ(y, free[2]);
    EXPECT_TRUE(rule.lhsDefinition("%t"));
    EXPECT_FALSE(rule.lhsDefinition("%u"));
}

TEST(RuleTest, DerivedRules) {
    FlagSet nnanNsz = FlagSet().with(FlagSet::NoNaNs).with(FlagSet::NoSignedZeros);
    Rule rule("r", Pre::True, {fadd("%r", x, zero, nnanNsz)}, {Instruction::copy("%r", x)}, true);

    Rule weaker = rule.withoutFlag(0, FlagSet::NoSignedZeros);
    EXPECT_TRUE(weaker.getLhs().front().getFlags().has(FlagSet::NoNaNs));
    EXPECT_FALSE(weaker.getLhs().front().getFlags().has(FlagSet::NoSignedZeros));
    EXPECT_TRUE(rule.getLhs().front().getFlags().has(FlagSet::NoSignedZeros));

    Rule converse = rule.reversed();
    EXPECT_EQ(Op::Copy, converse.lhsRoot().getOpcode());
    EXPECT_EQ(Op::FAdd, converse.rhsRoot().getOpcode());

    Rule disabled = rule.disable("too slow");
    EXPECT_FALSE(disabled.isActive());
    EXPECT_EQ("too slow", disabled.getReason());
    EXPECT_TRUE(disabled.enable().isActive());
}

TEST(RuleTest, RemovingAFlagSplitsFast) {
    Rule rule("r", Pre::True, {fadd("%r", x, zero, FlagSet::fastMath())}, {Instruction::copy("%r", x)});

    FlagSet flags = rule.withoutFlag(0, FlagSet::NoNaNs).getLhs().front().getFlags();
    EXPECT_FALSE(flags.isFast());
    EXPECT_FALSE(flags.has(FlagSet::NoNaNs));
    EXPECT_TRUE(flags.has(FlagSet::NoInfs));
    EXPECT_TRUE(flags.has(FlagSet::NoSignedZeros));

    std::vector<FlagSet::Flag> effective = FlagSet::fastMath().effective();
    EXPECT_EQ(FlagSet::all, effective);
    EXPECT_EQ("%r = fadd ninf nsz %x, +0.0", str(rule.withoutFlag(0, FlagSet::NoNaNs).lhsRoot()));
}
