// rounding.cpp
// Significant-error formatting. The error fixes the rounding shift; the value
// inherits the decimal places of the rendered error.

#include "sigqalc/rounding.hpp"

#include <charconv>
#include <cmath>
#include <string>

#include "sigqalc/logging.hpp"
#include "sigqalc/quantity.hpp"

namespace sigqalc {

static std::string units_suffix(const Units &u) {
    return u.is_dimensionless() ? std::string() : " " + u.to_string();
}

// Leading decimal digit of abs_err, which lies in [10^exponent, 10^(exponent+1)).
static int leading_digit_of(double abs_err, int exponent) {
    double unit = std::pow(10.0, exponent);
    if (unit > 0.0) return static_cast<int>(std::floor(abs_err / unit));
    // 10^exponent underflows for subnormal errors
    std::string digits = Decimal::from_double(abs_err).to_plain_string();
    return digits[digits.find_first_not_of("0.")] - '0';
}

std::string format_with_significant_error(const Quantity &q, int sig_digits, bool leading_one_exception) {
    FormatConfig cfg;
    cfg.sig_digits = sig_digits;
    cfg.leading_one_exception = leading_one_exception;
    return format_with_significant_error(q, cfg);
}

std::string format_with_significant_error(const Quantity &q, const FormatConfig &cfg) {
    cfg.validate();

    std::string unit_str = units_suffix(q.units());

    if (q.error() == 0.0) {
        return format_double(q.value()) + NO_ERROR_SUFFIX + unit_str;
    }
    if (q.has_unbounded_error()) {
        SIGQALC_DEBUG("unbounded error, value {} printed without rounding", q.value());
        return format_double(q.value()) + PLUS_MINUS + INFINITY_SYMBOL + unit_str;
    }

    double abs_err = std::fabs(q.error());
    int exponent = static_cast<int>(std::floor(std::log10(abs_err)));
    int leading_digit = leading_digit_of(abs_err, exponent);

    int final_sig = cfg.sig_digits;
    if (cfg.leading_one_exception && leading_digit == 1 && cfg.sig_digits == 1) {
        final_sig = 2;
    }
    int shift = final_sig - 1 - exponent;
    SIGQALC_TRACE("error {}: exponent={} leading={} sig={} shift={}", abs_err, exponent, leading_digit,
                  final_sig, shift);

    std::string error_str = format_number_to_sig_digits(round_half_up_at(abs_err, shift), final_sig);

    // same shift for the value, then match the error's decimal places
    Decimal rounded_value = round_half_up_at(q.value(), shift);
    std::string value_str = format_number_to_min_decimals(rounded_value, count_decimals(error_str));

    return value_str + PLUS_MINUS + error_str + unit_str;
}

Decimal round_half_up_at(double x, int shift) {
    // The scaled product is taken at its shortest decimal, so 12.345 * 100
    // is the tie 1234.5 and rounds up.
    double scaled = x * std::pow(10.0, shift);
    if (std::isfinite(scaled)) {
        return Decimal::from_double(scaled).set_scale_half_up(0).scale_by_power_of_ten(-shift);
    }
    // out of binary64 range: scale the exact decimal of x instead
    SIGQALC_TRACE("{} * 10^{} overflows, rounding exactly", x, shift);
    return Decimal::from_double(x).scale_by_power_of_ten(shift).set_scale_half_up(0).scale_by_power_of_ten(-shift);
}

int count_significant_digits(const std::string &str) {
    std::string digits;
    for (char c : str) {
        if (c != '.' && c != '-') digits.push_back(c);
    }
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) return 0;
    return static_cast<int>(digits.size() - first);
}

int count_decimals(const std::string &str) {
    size_t idx = str.find('.');
    return idx == std::string::npos ? 0 : static_cast<int>(str.size() - idx - 1);
}

std::string format_number_to_sig_digits(const Decimal &num, int sig_digits) {
    if (num.is_zero()) {
        return sig_digits == 1 ? "0" : "0." + std::string(static_cast<size_t>(sig_digits - 1), '0');
    }

    std::string stripped = num.strip_trailing_zeros().to_plain_string();
    int have = count_significant_digits(stripped);
    if (have >= sig_digits) return stripped;

    std::string pad(static_cast<size_t>(sig_digits - have), '0');
    if (stripped.find('.') == std::string::npos) return stripped + "." + pad;
    return stripped + pad;
}

std::string format_number_to_min_decimals(const Decimal &num, int decimals) {
    Decimal bd = num.set_scale_half_up(decimals);
    if (decimals == 0) return bd.strip_trailing_zeros().to_plain_string();
    return bd.to_plain_string();
}

std::string format_double(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    if (v == 0.0) return std::signbit(v) ? "-0.0" : "0.0";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), std::fabs(v), std::chars_format::scientific);
    std::string s(buf, res.ptr);
    size_t e = s.find('e');
    int exp10 = std::stoi(s.substr(e + 1));
    std::string digits;
    for (size_t i = 0; i < e; ++i) {
        if (s[i] != '.') digits.push_back(s[i]);
    }

    std::string out;
    double a = std::fabs(v);
    if (a >= 1e-3 && a < 1e7) {
        if (exp10 >= 0) {
            size_t int_len = static_cast<size_t>(exp10) + 1;
            if (digits.size() < int_len) digits.append(int_len - digits.size(), '0');
            std::string frac = digits.substr(int_len);
            out = digits.substr(0, int_len) + "." + (frac.empty() ? "0" : frac);
        } else {
            out = "0." + std::string(static_cast<size_t>(-exp10 - 1), '0') + digits;
        }
    } else {
        out = digits.substr(0, 1) + "." + (digits.size() > 1 ? digits.substr(1) : "0") + "E" + std::to_string(exp10);
    }
    return v < 0 ? "-" + out : out;
}

} // namespace sigqalc
