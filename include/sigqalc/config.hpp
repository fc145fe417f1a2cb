// config.hpp
// Defaults and knobs shared by the arithmetic engine and the formatter.

#ifndef SIGQALC_INC_CONFIG_HPP
#define SIGQALC_INC_CONFIG_HPP

namespace sigqalc {

enum class ErrorPropagation {
    WORST_CASE,  // errors add linearly (fully correlated)
    QUADRATURE   // errors add in quadrature (independent)
};

// ----------------- Configuration -----------------
static const ErrorPropagation DEFAULT_PROPAGATION = ErrorPropagation::WORST_CASE;
static const int DEFAULT_SIG_DIGITS = 1;
static const int EXACT_CONVERSION_PREC = 53; // mpfr bits, matches binary64

static const char *const PLUS_MINUS = " \xC2\xB1 ";       // " ± "
static const char *const INFINITY_SYMBOL = "\xE2\x88\x9E"; // "∞"
static const char *const NO_ERROR_SUFFIX = " (no error)";

struct FormatConfig {
    int sig_digits = DEFAULT_SIG_DIGITS;
    bool leading_one_exception = false;

    // Throws PreconditionViolation(InvalidSignificantDigits) when sig_digits < 1.
    void validate() const;
};

} // namespace sigqalc

#endif // SIGQALC_INC_CONFIG_HPP
