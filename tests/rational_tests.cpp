// gtest
#include <gtest/gtest.h>

#include <climits>
#include <sstream>
#include <utility>

#include "sigqalc/errors.hpp"
#include "sigqalc/rational.hpp"

namespace sigqalcut {

using sigqalc::Condition;
using sigqalc::PreconditionViolation;
using sigqalc::Rational;

TEST(rational_tests, canonical_form) {
    EXPECT_EQ("1/2", Rational(2, 4).to_string());
    EXPECT_EQ("-1/2", Rational(3, -6).to_string());
    EXPECT_EQ("2", Rational(4, 2).to_string());
    EXPECT_EQ("0", Rational(0, 7).to_string());
    EXPECT_EQ(Rational(1, 2), Rational::half());
}

TEST(rational_tests, extreme_long_operands) {
    EXPECT_EQ("-1/9223372036854775808", Rational(1, LONG_MIN).to_string());
    EXPECT_EQ("9223372036854775808", Rational(LONG_MIN, -1).to_string());
    EXPECT_EQ(Rational::one(), Rational(LONG_MIN, LONG_MIN));
    EXPECT_EQ("-9223372036854775807", Rational(LONG_MAX, -1).to_string());
}

TEST(rational_tests, arithmetic) {
    Rational a(1, 2), b(1, 3);
    EXPECT_EQ(Rational(5, 6), a + b);
    EXPECT_EQ(Rational(1, 6), a - b);
    EXPECT_EQ(Rational(1, 6), a * b);
    EXPECT_EQ(Rational(-1, 2), -a);
    EXPECT_TRUE((a - a).is_zero());
    EXPECT_TRUE(b < a);
    EXPECT_NE(a, b);
}

TEST(rational_tests, constants) {
    EXPECT_TRUE(Rational::zero().is_zero());
    EXPECT_EQ(Rational(1), Rational::one());
    EXPECT_EQ(Rational::one(), Rational::half() + Rational::half());
}

TEST(rational_tests, to_double_rounds_to_nearest) {
    EXPECT_DOUBLE_EQ(0.5, Rational::half().to_double());
    EXPECT_EQ(1.0 / 3.0, Rational(1, 3).to_double());
    EXPECT_EQ(-2.0 / 3.0, Rational(-2, 3).to_double());
}

TEST(rational_tests, parse) {
    EXPECT_EQ(Rational(-3, 4), Rational("-3/4"));
    EXPECT_EQ(Rational(1, 2), Rational("2/4"));
    EXPECT_EQ(Rational(7), Rational("7"));
    EXPECT_THROW(Rational("abc"), PreconditionViolation);
    EXPECT_THROW(Rational(""), PreconditionViolation);
    EXPECT_THROW(Rational("1/0"), PreconditionViolation);
}

TEST(rational_tests, zero_denominator) {
    try {
        Rational r(1, 0);
        FAIL() << "expected ZeroDenominator, got " << r;
    } catch (const PreconditionViolation &e) {
        EXPECT_EQ(Condition::ZeroDenominator, e.condition());
    }
}

TEST(rational_tests, copy_and_move) {
    Rational a(3, 5);
    Rational b = a;
    Rational c = std::move(b);
    EXPECT_EQ(a, c);
    b = c;
    EXPECT_EQ(a, b);

    std::ostringstream os;
    os << c;
    EXPECT_EQ("3/5", os.str());
}

} // namespace sigqalcut
