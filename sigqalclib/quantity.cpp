// quantity.cpp
// Error-propagating arithmetic.
//   WORST_CASE: contributions add linearly.
//   QUADRATURE: contributions add as root-sum-of-squares.
// Unary functions use first-order propagation, df ~ |f'(x)| dx.

#include "sigqalc/quantity.hpp"

#include <cmath>
#include <ostream>
#include <utility>

#include "sigqalc/errors.hpp"
#include "sigqalc/logging.hpp"
#include "sigqalc/rounding.hpp"

namespace sigqalc {

static const double UNBOUNDED = HUGE_VAL;

static double sq(double x) { return x * x; }

static double combine(double a, double b, ErrorPropagation model) {
    switch (model) {
    case ErrorPropagation::WORST_CASE: return a + b;
    case ErrorPropagation::QUADRATURE: return std::hypot(a, b);
    }
    return a + b;
}

// |df/dx| * dx, keeping exact and unbounded errors out of 0 * inf.
static double linear_error(double dfdx, double err) {
    if (err == 0.0) return 0.0;
    if (std::isinf(err)) return UNBOUNDED;
    return std::fabs(dfdx) * err;
}

static void require_dimensionless(const Units &u, const char *fn) {
    if (!u.is_dimensionless()) {
        fail_precondition(Condition::NotDimensionless,
                          std::string(fn) + "(...) requires dimensionless quantity, got '" + u.to_string() + "'");
    }
}

Quantity::Quantity(double value, double error, Units units)
    : value_(value), error_(error), units_(std::move(units)) {
    require(std::isfinite(value), Condition::NonFiniteValue, "value must be finite");
    // NaN fails here as well
    require(error >= 0.0, Condition::NegativeError, "error must be >= 0");
}

Quantity Quantity::add(const Quantity &o, ErrorPropagation model) const {
    if (units_ != o.units_) {
        fail_precondition(Condition::UnitMismatch, "cannot add quantities with different units ('" +
                                                       units_.to_string() + "' vs '" + o.units_.to_string() + "')");
    }
    return Quantity(value_ + o.value_, combine(error_, o.error_, model), units_);
}

Quantity Quantity::subtract(const Quantity &o, ErrorPropagation model) const {
    if (units_ != o.units_) {
        fail_precondition(Condition::UnitMismatch, "cannot subtract quantities with different units ('" +
                                                       units_.to_string() + "' vs '" + o.units_.to_string() + "')");
    }
    return Quantity(value_ - o.value_, combine(error_, o.error_, model), units_);
}

Quantity Quantity::multiply(const Quantity &o, ErrorPropagation model) const {
    double err = UNBOUNDED;
    if (!has_unbounded_error() && !o.has_unbounded_error()) {
        err = combine(std::fabs(o.value_) * error_, std::fabs(value_) * o.error_, model);
    }
    return Quantity(value_ * o.value_, err, units_ * o.units_);
}

Quantity Quantity::divide(const Quantity &o, ErrorPropagation model) const {
    double v = value_ / o.value_;

    // Policy, not a computation: a denominator range that contains zero
    // makes the error unbounded whatever the model.
    if (o.value_ - o.error_ <= 0.0 && o.value_ + o.error_ >= 0.0) {
        SIGQALC_DEBUG("unstable division: denominator {} +/- {} straddles zero", o.value_, o.error_);
        return Quantity(v, UNBOUNDED, units_ / o.units_);
    }

    double err = UNBOUNDED;
    if (!has_unbounded_error()) {
        double a = error_ / std::fabs(o.value_);
        double b = std::fabs(value_) * o.error_ / sq(o.value_);
        err = combine(a, b, model);
    }
    return Quantity(v, err, units_ / o.units_);
}

Quantity Quantity::negate() const {
    return Quantity(-value_, error_, units_);
}

Quantity Quantity::pow(const Rational &p) const {
    // exponent bookkeeping stays exact; only the numeric part goes through binary64
    double pd = p.to_double();
    double v = std::pow(value_, pd);
    double dfdx = pd * std::pow(value_, pd - 1.0);
    return Quantity(v, linear_error(dfdx, error_), units_.pow(p));
}

Quantity Quantity::sqrt() const {
    return pow(Rational::half());
}

Quantity Quantity::exp() const {
    require_dimensionless(units_, "exp");
    double v = std::exp(value_);
    return Quantity(v, linear_error(v, error_), Units::none());
}

Quantity Quantity::log() const {
    require_dimensionless(units_, "log");
    require(value_ > 0.0, Condition::NonPositiveLogArgument, "log(...) requires a positive value");
    return Quantity(std::log(value_), linear_error(1.0 / value_, error_), Units::none());
}

Quantity Quantity::sin() const {
    require_dimensionless(units_, "sin");
    return Quantity(std::sin(value_), linear_error(std::cos(value_), error_), Units::none());
}

Quantity Quantity::cos() const {
    require_dimensionless(units_, "cos");
    return Quantity(std::cos(value_), linear_error(std::sin(value_), error_), Units::none());
}

std::string Quantity::format_with_significant_error(int sig_digits, bool leading_one_exception) const {
    return sigqalc::format_with_significant_error(*this, sig_digits, leading_one_exception);
}

std::string Quantity::format_with_significant_error(const FormatConfig &cfg) const {
    return sigqalc::format_with_significant_error(*this, cfg);
}

std::string Quantity::to_string() const {
    std::string out = format_double(value_) + " +/- " + format_double(error_);
    if (!units_.is_dimensionless()) out += " " + units_.to_string();
    return out;
}

std::ostream &operator<<(std::ostream &os, const Quantity &q) {
    return os << q.to_string();
}

} // namespace sigqalc
