#include <cmath>
#include <cstdint>
#include <limits>

#include "gtest/gtest.h"
#include "llvm/Support/MathExtras.h"

#include "evalexpr/environment.h"
#include "evalexpr/value.h"

using namespace evalexpr;

TEST(ValueTest, DefaultIsNone) {
    Value v;
    EXPECT_TRUE(v.isNone());
    EXPECT_EQ(v.str(), "NONE");
}

TEST(ValueTest, FloatsPrintShortestRoundTrip) {
    EXPECT_EQ(formatFloat(3.5), "3.5");
    EXPECT_EQ(formatFloat(3.0), "3.0");
    EXPECT_EQ(formatFloat(0.1), "0.1");
    EXPECT_EQ(formatFloat(-0.25), "-0.25");
    EXPECT_EQ(formatFloat(1e16), "1e+16");
    EXPECT_EQ(formatFloat(10.0), "10.0");
    EXPECT_EQ(formatFloat(100.0), "100.0");
    EXPECT_EQ(formatFloat(1500.0), "1500.0");
    EXPECT_EQ(formatFloat(-1234.5), "-1234.5");
    EXPECT_EQ(formatFloat(1e15), "1000000000000000.0");
    EXPECT_EQ(formatFloat(1e-5), "1e-05");
    EXPECT_EQ(formatFloat(1.5e-5), "1.5e-05");
    EXPECT_EQ(formatFloat(0.0001), "0.0001");
    EXPECT_EQ(formatFloat(0.00012), "0.00012");
    EXPECT_EQ(formatFloat(0.0), "0.0");
    EXPECT_EQ(formatFloat(-0.0), "-0.0");
    EXPECT_EQ(formatFloat(1.5e300), "1.5e+300");
    EXPECT_EQ(formatFloat(1.0 / 3.0), "0.3333333333333333");
    EXPECT_EQ(formatFloat(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(formatFloat(std::nan("")), "nan");
}

TEST(ValueTest, PrintsEveryKind) {
    EXPECT_EQ(Value::integer(-42).str(), "-42");
    EXPECT_EQ(Value::floating(2.0).str(), "2.0");
    EXPECT_EQ(Value::boolean(true).str(), "TRUE");
    EXPECT_EQ(Value::boolean(false).str(), "FALSE");
    EXPECT_EQ(Value::list({Value::integer(1), Value::floating(2.5), Value::none()}).str(),
              "[1, 2.5, NONE]");
    EXPECT_EQ(Value::list({}).str(), "[]");

    llvm::raw_null_ostream out;
    Environment env = makeGlobalEnvironment(out);
    EXPECT_EQ(env.lookup("sin")->str(), "<built-in function sin>");
}

TEST(ValueTest, OnlyFalseAndNoneAreFalsy) {
    EXPECT_FALSE(Value::none().isTruthy());
    EXPECT_FALSE(Value::boolean(false).isTruthy());
    EXPECT_TRUE(Value::boolean(true).isTruthy());
    EXPECT_TRUE(Value::integer(0).isTruthy());
    EXPECT_TRUE(Value::floating(0.0).isTruthy());
    EXPECT_TRUE(Value::list({}).isTruthy());
}

TEST(ValueTest, NumbersAreEqualAcrossKinds) {
    EXPECT_TRUE(Value::integer(1).equals(Value::floating(1.0)));
    EXPECT_TRUE(Value::boolean(true).equals(Value::integer(1)));
    EXPECT_TRUE(Value::boolean(false).equals(Value::floating(0.0)));
    EXPECT_FALSE(Value::integer(2).equals(Value::floating(2.5)));
}

TEST(ValueTest, LargeIntegersCompareExactlyWithFloats) {
    // 2^53 + 1 has no double spelling; it must not round onto 2^53.
    EXPECT_FALSE(Value::integer(9007199254740993).equals(Value::floating(9007199254740992.0)));
    EXPECT_TRUE(Value::integer(9007199254740992).equals(Value::floating(9007199254740992.0)));
    EXPECT_FALSE(Value::integer(INT64_MAX).equals(Value::floating(9223372036854775808.0)));

    EXPECT_EQ(compareNumeric(Value::integer(9007199254740993), Value::floating(9007199254740992.0)), 1);
    EXPECT_EQ(compareNumeric(Value::floating(9007199254740992.0), Value::integer(9007199254740993)), -1);
    EXPECT_EQ(compareNumeric(Value::integer(INT64_MAX), Value::floating(9223372036854775808.0)), -1);
    EXPECT_EQ(compareNumeric(Value::integer(INT64_MIN), Value::floating(-9223372036854775808.0)), 0);
    EXPECT_EQ(compareNumeric(Value::integer(-3), Value::floating(-2.5)), -1);
    EXPECT_EQ(compareNumeric(Value::integer(2), Value::floating(2.5)), -1);
    EXPECT_EQ(compareNumeric(Value::integer(INT64_MIN), Value::floating(-std::numeric_limits<double>::infinity())), 1);
    EXPECT_EQ(compareNumeric(Value::boolean(true), Value::floating(0.5)), 1);
    EXPECT_FALSE(compareNumeric(Value::integer(0),
                                Value::floating(std::numeric_limits<double>::quiet_NaN())));
}

TEST(ValueTest, EqualityOfOtherKinds) {
    EXPECT_TRUE(Value::none().equals(Value::none()));
    EXPECT_FALSE(Value::none().equals(Value::integer(0)));
    EXPECT_FALSE(Value::none().equals(Value::boolean(false)));

    Value a = Value::list({Value::integer(1), Value::list({Value::boolean(true)})});
    Value b = Value::list({Value::floating(1.0), Value::list({Value::integer(1)})});
    EXPECT_TRUE(a.equals(b));
    EXPECT_FALSE(a.equals(Value::list({Value::integer(1)})));
    EXPECT_FALSE(a.equals(Value::integer(1)));
}

TEST(ValueTest, BuiltinsCompareByIdentity) {
    llvm::raw_null_ostream out;
    Environment env = makeGlobalEnvironment(out);
    Value sin = *env.lookup("sin");
    Value sinCopy = sin;
    EXPECT_TRUE(sin.equals(sinCopy));
    EXPECT_FALSE(sin.equals(*env.lookup("print")));

    Value lookalike = Value::builtin("sin", [](llvm::ArrayRef<Value>) -> llvm::Expected<Value> {
        return Value::none();
    });
    EXPECT_FALSE(sin.equals(lookalike));
}

TEST(ValueTest, IdentityDistinguishesNumericKinds) {
    EXPECT_FALSE(Value::integer(1).isIdenticalTo(Value::floating(1.0)));
    EXPECT_TRUE(Value::floating(1.0).isIdenticalTo(Value::floating(1.0)));
    EXPECT_TRUE(Value::floating(std::nan("")).isIdenticalTo(Value::floating(std::nan(""))));
    EXPECT_FALSE(Value::boolean(true).isIdenticalTo(Value::integer(1)));
}

TEST(EnvironmentTest, BuiltinsAreSeeded) {
    llvm::raw_null_ostream out;
    Environment env = makeGlobalEnvironment(out);
    EXPECT_EQ(env.size(), 4u);
    ASSERT_TRUE(env.contains("pi"));
    EXPECT_DOUBLE_EQ(env.lookup("pi")->getFloat(), llvm::numbers::pi);
    EXPECT_DOUBLE_EQ(env.lookup("e")->getFloat(), std::exp(1.0));
    EXPECT_TRUE(env.lookup("sin")->isBuiltin());
    EXPECT_TRUE(env.lookup("print")->isBuiltin());
    EXPECT_EQ(env.lookup("cos"), nullptr);
}

TEST(EnvironmentTest, BindReplacesExistingBinding) {
    Environment env;
    env.bind("x", Value::integer(1));
    env.bind("x", Value::floating(2.5));
    EXPECT_EQ(env.size(), 1u);
    EXPECT_EQ(env.lookup("x")->str(), "2.5");
}

TEST(EnvironmentTest, PrintWritesSpaceSeparatedArguments) {
    std::string text;
    llvm::raw_string_ostream out(text);
    Environment env = makeGlobalEnvironment(out);

    const Builtin& print = env.lookup("print")->getBuiltin();
    Value args[] = {Value::integer(1), Value::floating(2.5), Value::boolean(true), Value::none()};
    llvm::Expected<Value> result = print.fn(args);
    ASSERT_TRUE(static_cast<bool>(result));
    EXPECT_TRUE(result->isNone());
    EXPECT_EQ(out.str(), "1 2.5 TRUE NONE\n");
}

TEST(EnvironmentTest, SinRejectsBadArguments) {
    llvm::raw_null_ostream out;
    Environment env = makeGlobalEnvironment(out);
    const Builtin& sin = env.lookup("sin")->getBuiltin();

    llvm::Expected<Value> noArgs = sin.fn({});
    EXPECT_FALSE(static_cast<bool>(noArgs));
    llvm::consumeError(noArgs.takeError());

    Value listArg[] = {Value::list({})};
    llvm::Expected<Value> wrongKind = sin.fn(listArg);
    EXPECT_FALSE(static_cast<bool>(wrongKind));
    llvm::consumeError(wrongKind.takeError());

    Value half[] = {Value::floating(llvm::numbers::pi / 2)};
    llvm::Expected<Value> one = sin.fn(half);
    ASSERT_TRUE(static_cast<bool>(one));
    EXPECT_NEAR(one->getFloat(), 1.0, 1e-12);
}
