#include "sigqalc/errors.hpp"
#include "sigqalc/logging.hpp"

namespace sigqalc {

const char *condition_name(Condition c) {
    switch (c) {
    case Condition::NegativeError: return "NegativeError";
    case Condition::NonFiniteValue: return "NonFiniteValue";
    case Condition::UnitMismatch: return "UnitMismatch";
    case Condition::NotDimensionless: return "NotDimensionless";
    case Condition::NonPositiveLogArgument: return "NonPositiveLogArgument";
    case Condition::InvalidSignificantDigits: return "InvalidSignificantDigits";
    case Condition::ZeroDenominator: return "ZeroDenominator";
    case Condition::MalformedNumber: return "MalformedNumber";
    }
    return "Unknown";
}

PreconditionViolation::PreconditionViolation(Condition c, const std::string &detail)
    : std::logic_error(std::string(condition_name(c)) + ": " + detail), condition_(c) {}

void fail_precondition(Condition c, const std::string &detail) {
    SIGQALC_DEBUG("precondition violated: {}: {}", condition_name(c), detail);
    throw PreconditionViolation(c, detail);
}

} // namespace sigqalc
