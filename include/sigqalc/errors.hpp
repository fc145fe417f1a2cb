// errors.hpp
// Precondition violations raised by the quantity engine.
// These signal caller bugs; in-band conditions (unbounded error) never throw.

#ifndef SIGQALC_INC_ERRORS_HPP
#define SIGQALC_INC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sigqalc {

enum class Condition {
    NegativeError,
    NonFiniteValue,
    UnitMismatch,
    NotDimensionless,
    NonPositiveLogArgument,
    InvalidSignificantDigits,
    ZeroDenominator,
    MalformedNumber
};

const char *condition_name(Condition c);

class PreconditionViolation : public std::logic_error {
public:
    PreconditionViolation(Condition c, const std::string &detail);

    Condition condition() const { return condition_; }

private:
    Condition condition_;
};

// Logs the violation and throws PreconditionViolation.
[[noreturn]] void fail_precondition(Condition c, const std::string &detail);

// Fixed message only; checks with a formatted message branch to fail_precondition.
inline void require(bool ok, Condition c, const char *detail) {
    if (!ok) fail_precondition(c, detail);
}

} // namespace sigqalc

#endif // SIGQALC_INC_ERRORS_HPP
