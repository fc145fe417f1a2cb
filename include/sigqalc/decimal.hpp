// decimal.hpp
// Arbitrary-precision decimal: unscaled GMP integer times 10^-scale.
// Used for half-up rounding at a decimal shift, where binary rounding mis-rounds ties.

#ifndef SIGQALC_INC_DECIMAL_HPP
#define SIGQALC_INC_DECIMAL_HPP

#include <iosfwd>
#include <string>

#include <gmp.h>

namespace sigqalc {

class Decimal {
public:
    Decimal();
    Decimal(long unscaled, long scale);

    Decimal(const Decimal &o);
    Decimal(Decimal &&o) noexcept;
    Decimal &operator=(const Decimal &o);
    Decimal &operator=(Decimal &&o) noexcept;
    ~Decimal();

    // Shortest decimal that reads back as v.
    static Decimal from_double(double v);
    // [-]digits[.digits][(e|E)[+-]digits]
    static Decimal parse(const std::string &text);

    long scale() const { return scale_; }
    int signum() const { return mpz_sgn(unscaled); }
    bool is_zero() const { return mpz_sgn(unscaled) == 0; }

    // Rescale to new_scale fractional digits; ties round away from zero.
    Decimal set_scale_half_up(long new_scale) const;
    Decimal strip_trailing_zeros() const;
    // Exact multiplication by 10^n.
    Decimal scale_by_power_of_ten(long n) const;

    std::string to_plain_string() const;

    bool operator==(const Decimal &o) const {
        return scale_ == o.scale_ && mpz_cmp(unscaled, o.unscaled) == 0;
    }
    bool operator!=(const Decimal &o) const { return !(*this == o); }

private:
    mpz_t unscaled;
    long scale_;
};

std::ostream &operator<<(std::ostream &os, const Decimal &d);

} // namespace sigqalc

#endif // SIGQALC_INC_DECIMAL_HPP
