#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <string>

#include "cobra/value.hpp"

using cobra::FlagType;
using cobra::FlagValue;
using cobra::Scalar;
using cobra::ScalarList;

TEST(Value, RendersNumbersLikeTheCommandLine) {
    EXPECT_EQ(cobra::toString(Scalar(12.0)), "12");
    EXPECT_EQ(cobra::toString(Scalar(0.5)), "0.5");
    EXPECT_EQ(cobra::toString(Scalar(-0.0)), "0");
    EXPECT_EQ(cobra::toString(Scalar(-3.25)), "-3.25");
    EXPECT_EQ(cobra::toString(Scalar(true)), "true");
    EXPECT_EQ(cobra::toString(Scalar(std::string("x"))), "x");
}

TEST(Value, RendersListsCommaSeparated) {
    const FlagValue v(ScalarList{Scalar(1.0), Scalar(std::string("a")), Scalar(false)});
    EXPECT_EQ(cobra::toString(v), "1,a,false");
    EXPECT_EQ(cobra::toString(FlagValue(ScalarList{})), "");
}

TEST(Value, NumericTokens) {
    EXPECT_TRUE(cobra::isNumber("12"));
    EXPECT_TRUE(cobra::isNumber("-3.5"));
    EXPECT_TRUE(cobra::isNumber("+7"));
    EXPECT_TRUE(cobra::isNumber(".5"));
    EXPECT_TRUE(cobra::isNumber("5."));
    EXPECT_TRUE(cobra::isNumber("1e5"));
    EXPECT_TRUE(cobra::isNumber("0x1f"));

    EXPECT_FALSE(cobra::isNumber(""));
    EXPECT_FALSE(cobra::isNumber("abc"));
    EXPECT_FALSE(cobra::isNumber("1e"));
    EXPECT_FALSE(cobra::isNumber("."));
    EXPECT_FALSE(cobra::isNumber("12px"));
    EXPECT_FALSE(cobra::isNumber("0x"));
}

TEST(Value, ZeroValues) {
    EXPECT_EQ(cobra::zeroValue(FlagType::String), Scalar(std::string()));
    EXPECT_EQ(cobra::zeroValue(FlagType::Boolean), Scalar(false));
    EXPECT_EQ(cobra::zeroValue(FlagType::Number), Scalar(0.0));
    EXPECT_EQ(cobra::typeName(FlagType::Number), "number");
}

TEST(Value, FirstScalarOfList) {
    EXPECT_EQ(cobra::firstScalar(FlagValue(ScalarList{Scalar(1.0), Scalar(2.0)})), Scalar(1.0));
    EXPECT_EQ(cobra::firstScalar(FlagValue(std::string("x"))), Scalar(std::string("x")));
    EXPECT_FALSE(cobra::firstScalar(FlagValue(ScalarList{})).has_value());
    EXPECT_EQ(cobra::toList(FlagValue(3.0)).size(), 1u);
}

TEST(Value, ScalarToArithmetic) {
    int i = -1;
    EXPECT_TRUE(cobra::scalarTo(Scalar(12.0), i));
    EXPECT_EQ(i, 12);
    EXPECT_TRUE(cobra::scalarTo(Scalar(std::string("42")), i));
    EXPECT_EQ(i, 42);
    EXPECT_TRUE(cobra::scalarTo(Scalar(std::string()), i));
    EXPECT_EQ(i, 0);
    EXPECT_TRUE(cobra::scalarTo(Scalar(true), i));
    EXPECT_EQ(i, 1);

    double d = 0.0;
    EXPECT_FALSE(cobra::scalarTo(Scalar(std::string("abc")), d));
}

TEST(Value, ScalarToBool) {
    bool b = false;
    EXPECT_TRUE(cobra::scalarTo(Scalar(std::string("yes")), b));
    EXPECT_TRUE(b);
    EXPECT_TRUE(cobra::scalarTo(Scalar(0.0), b));
    EXPECT_FALSE(b);
    EXPECT_TRUE(cobra::scalarTo(Scalar(std::string()), b));
    EXPECT_FALSE(b);
    EXPECT_FALSE(cobra::scalarTo(Scalar(std::string("maybe")), b));
}

TEST(Value, ScalarToString) {
    std::string s;
    EXPECT_TRUE(cobra::scalarTo(Scalar(8080.0), s));
    EXPECT_EQ(s, "8080");
    EXPECT_TRUE(cobra::scalarTo(Scalar(false), s));
    EXPECT_EQ(s, "false");
}

TEST(Value, ScalarToRejectsNumbersOutsideTheTargetRange) {
    int i = 7;
    EXPECT_FALSE(cobra::scalarTo(Scalar(1e20), i));
    EXPECT_FALSE(cobra::scalarTo(Scalar(-1e20), i));
    EXPECT_FALSE(cobra::scalarTo(Scalar(std::nan("")), i));
    EXPECT_FALSE(cobra::scalarTo(Scalar(std::string("3e10")), i));
    EXPECT_EQ(i, 7);
    EXPECT_TRUE(cobra::scalarTo(Scalar(2147483647.0), i));
    EXPECT_EQ(i, 2147483647);

    std::uint8_t small = 0;
    EXPECT_FALSE(cobra::scalarTo(Scalar(256.0), small));
    EXPECT_TRUE(cobra::scalarTo(Scalar(255.0), small));
    EXPECT_EQ(small, 255);

    unsigned u = 0;
    EXPECT_FALSE(cobra::scalarTo(Scalar(-1.0), u));

    std::int64_t big = 0;
    EXPECT_FALSE(cobra::scalarTo(Scalar(9.3e18), big));

    float f = 0.0f;
    EXPECT_FALSE(cobra::scalarTo(Scalar(1e300), f));
    double d = 0.0;
    EXPECT_TRUE(cobra::scalarTo(Scalar(1e300), d));
}
