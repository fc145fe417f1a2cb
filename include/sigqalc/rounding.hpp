// rounding.hpp
// Significant-error formatter: rounds the error to a number of significant
// digits and prints the value to the same decimal place.
//
//   1. E = |error|, exponent = floor(log10(E)), leading digit = floor(E / 10^exponent).
//   2. With the leading-one exception, a leading 1 at one digit is shown with two.
//   3. shift = sig - 1 - exponent; error and value are rounded half-up at 10^shift.
//   4. The error is written with exactly sig significant digits.
//   5. The value is written with as many decimals as the error string has.

#ifndef SIGQALC_INC_ROUNDING_HPP
#define SIGQALC_INC_ROUNDING_HPP

#include <string>

#include "sigqalc/config.hpp"
#include "sigqalc/decimal.hpp"

namespace sigqalc {

class Quantity;

std::string format_with_significant_error(const Quantity &q, int sig_digits, bool leading_one_exception);
std::string format_with_significant_error(const Quantity &q, const FormatConfig &cfg);

// round(x * 10^shift) half-up, as an exact decimal scaled back by 10^-shift.
Decimal round_half_up_at(double x, int shift);

// Ignores sign, the decimal point and leading zeros; trailing zeros count.
int count_significant_digits(const std::string &str);
// Digits after the decimal point, 0 when there is none.
int count_decimals(const std::string &str);
// Plain string of an already rounded number, padded to exactly sig_digits digits.
std::string format_number_to_sig_digits(const Decimal &num, int sig_digits);
// num rounded half-up to decimals places; decimals == 0 gives a bare integer.
std::string format_number_to_min_decimals(const Decimal &num, int decimals);

// Default rendering of a double: shortest digits, "100.0", "1.234", "1.0E7", "2.5E-4".
std::string format_double(double v);

} // namespace sigqalc

#endif // SIGQALC_INC_ROUNDING_HPP
