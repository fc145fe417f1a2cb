#include "sigqalc/config.hpp"

#include <string>

#include "sigqalc/errors.hpp"

namespace sigqalc {

void FormatConfig::validate() const {
    if (sig_digits < 1) {
        fail_precondition(Condition::InvalidSignificantDigits,
                          "significant digits must be >= 1, got " + std::to_string(sig_digits));
    }
}

} // namespace sigqalc
