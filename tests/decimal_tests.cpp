// gtest
#include <gtest/gtest.h>

#include <cmath>

#include "sigqalc/decimal.hpp"
#include "sigqalc/errors.hpp"

namespace sigqalcut {

using sigqalc::Decimal;
using sigqalc::PreconditionViolation;

TEST(decimal_tests, from_double_is_shortest) {
    EXPECT_EQ("0.1", Decimal::from_double(0.1).to_plain_string());
    EXPECT_EQ("1234.5", Decimal::from_double(12.345 * 100).to_plain_string());
    EXPECT_EQ("12.3", Decimal::from_double(0.0123 * 1000).to_plain_string());
    EXPECT_EQ("-2.5", Decimal::from_double(-2.5).to_plain_string());
    EXPECT_EQ("0", Decimal::from_double(0.0).to_plain_string());
    EXPECT_EQ("0", Decimal::from_double(-0.0).to_plain_string());
    EXPECT_EQ("10000000000000000000000", Decimal::from_double(1e22).to_plain_string());
    EXPECT_THROW(Decimal::from_double(HUGE_VAL), PreconditionViolation);
}

TEST(decimal_tests, half_up_rounds_ties_away_from_zero) {
    EXPECT_EQ("1235", Decimal::parse("1234.5").set_scale_half_up(0).to_plain_string());
    EXPECT_EQ("-1235", Decimal::parse("-1234.5").set_scale_half_up(0).to_plain_string());
    EXPECT_EQ("1234", Decimal::parse("1234.4999").set_scale_half_up(0).to_plain_string());
    EXPECT_EQ("1.3", Decimal::parse("1.25").set_scale_half_up(1).to_plain_string());
    EXPECT_EQ("-1.3", Decimal::parse("-1.25").set_scale_half_up(1).to_plain_string());
    EXPECT_EQ("1.2", Decimal::parse("1.24").set_scale_half_up(1).to_plain_string());
    EXPECT_EQ("1", Decimal::parse("0.5").set_scale_half_up(0).to_plain_string());
    EXPECT_EQ("0", Decimal::parse("0.49").set_scale_half_up(0).to_plain_string());
}

TEST(decimal_tests, widening_scale_keeps_zeros) {
    EXPECT_EQ("12.300", Decimal::parse("12.3").set_scale_half_up(3).to_plain_string());
    EXPECT_EQ("0.00", Decimal().set_scale_half_up(2).to_plain_string());
}

TEST(decimal_tests, strip_trailing_zeros) {
    Decimal d = Decimal::parse("1.500").strip_trailing_zeros();
    EXPECT_EQ("1.5", d.to_plain_string());
    EXPECT_EQ(1, d.scale());

    Decimal h = Decimal::parse("100").strip_trailing_zeros();
    EXPECT_EQ(-2, h.scale());
    EXPECT_EQ("100", h.to_plain_string());

    EXPECT_EQ(0, Decimal::parse("0.000").strip_trailing_zeros().scale());
}

TEST(decimal_tests, scale_by_power_of_ten_is_exact) {
    EXPECT_EQ("0.01", Decimal(1, 0).scale_by_power_of_ten(-2).to_plain_string());
    EXPECT_EQ("12000", Decimal(12, 0).scale_by_power_of_ten(3).to_plain_string());
    EXPECT_EQ("0.0000000033", Decimal(33, 0).scale_by_power_of_ten(-10).to_plain_string());
}

TEST(decimal_tests, parse_forms) {
    EXPECT_EQ(Decimal(15, 1), Decimal::parse("1.5"));
    EXPECT_EQ(Decimal(5, 1), Decimal::parse(".5"));
    EXPECT_EQ("12300", Decimal::parse("1.23e4").to_plain_string());
    EXPECT_EQ("0.00012", Decimal::parse("1.2E-4").to_plain_string());
    EXPECT_EQ(-1, Decimal::parse("-7").signum());
    EXPECT_EQ(5, Decimal::parse("0.00123").scale());
}

TEST(decimal_tests, parse_rejects_garbage) {
    EXPECT_THROW(Decimal::parse(""), PreconditionViolation);
    EXPECT_THROW(Decimal::parse("-"), PreconditionViolation);
    EXPECT_THROW(Decimal::parse("1.2.3"), PreconditionViolation);
    EXPECT_THROW(Decimal::parse("e5"), PreconditionViolation);
    EXPECT_THROW(Decimal::parse("1e"), PreconditionViolation);
    EXPECT_THROW(Decimal::parse("12abc"), PreconditionViolation);
}

} // namespace sigqalcut
