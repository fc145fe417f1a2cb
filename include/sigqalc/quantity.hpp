// quantity.hpp
// Measured value with a non-negative (possibly unbounded) error and units.
// Every operation returns a new Quantity; errors propagate to first order.

#ifndef SIGQALC_INC_QUANTITY_HPP
#define SIGQALC_INC_QUANTITY_HPP

#include <cmath>
#include <iosfwd>
#include <string>

#include "sigqalc/config.hpp"
#include "sigqalc/rational.hpp"
#include "sigqalc/units.hpp"

namespace sigqalc {

class Quantity {
public:
    // value must be finite; error must be >= 0 or +inf.
    Quantity(double value, double error, Units units = Units());

    double value() const { return value_; }
    double error() const { return error_; }
    const Units &units() const { return units_; }

    // +inf error: propagation failed (e.g. division by a range straddling zero).
    bool has_unbounded_error() const { return std::isinf(error_); }

    // Require equal units.
    Quantity add(const Quantity &o, ErrorPropagation model = DEFAULT_PROPAGATION) const;
    Quantity subtract(const Quantity &o, ErrorPropagation model = DEFAULT_PROPAGATION) const;

    Quantity multiply(const Quantity &o, ErrorPropagation model = DEFAULT_PROPAGATION) const;
    Quantity divide(const Quantity &o, ErrorPropagation model = DEFAULT_PROPAGATION) const;
    Quantity negate() const;

    Quantity pow(const Rational &p) const;
    Quantity sqrt() const;
    // Dimensionless operands only; the result is dimensionless.
    Quantity exp() const;
    Quantity log() const;
    Quantity sin() const;
    Quantity cos() const;

    std::string format_with_significant_error(int sig_digits, bool leading_one_exception) const;
    std::string format_with_significant_error(const FormatConfig &cfg) const;

    // Diagnostic form: "value +/- error[ units]".
    std::string to_string() const;

private:
    double value_;
    double error_;
    Units units_;
};

inline Quantity operator+(const Quantity &a, const Quantity &b) { return a.add(b); }
inline Quantity operator-(const Quantity &a, const Quantity &b) { return a.subtract(b); }
inline Quantity operator*(const Quantity &a, const Quantity &b) { return a.multiply(b); }
inline Quantity operator/(const Quantity &a, const Quantity &b) { return a.divide(b); }
inline Quantity operator-(const Quantity &a) { return a.negate(); }

std::ostream &operator<<(std::ostream &os, const Quantity &q);

} // namespace sigqalc

#endif // SIGQALC_INC_QUANTITY_HPP
