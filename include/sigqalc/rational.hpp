// rational.hpp
// Exact rational numbers (GMP mpq_t) used for unit exponents.

#ifndef SIGQALC_INC_RATIONAL_HPP
#define SIGQALC_INC_RATIONAL_HPP

#include <iosfwd>
#include <string>

#include <gmp.h>

namespace sigqalc {

class Rational {
public:
    Rational();
    Rational(long num, long den = 1);
    // Accepts "n" or "n/d" in base 10.
    explicit Rational(const std::string &text);

    Rational(const Rational &o);
    Rational(Rational &&o) noexcept;
    Rational &operator=(const Rational &o);
    Rational &operator=(Rational &&o) noexcept;
    ~Rational();

    static const Rational &zero();
    static const Rational &one();
    static const Rational &half();

    bool is_zero() const { return mpq_sgn(q) == 0; }
    int sign() const { return mpq_sgn(q); }

    Rational operator+(const Rational &o) const;
    Rational operator-(const Rational &o) const;
    Rational operator*(const Rational &o) const;
    Rational operator-() const;

    bool operator==(const Rational &o) const { return mpq_equal(q, o.q) != 0; }
    bool operator!=(const Rational &o) const { return !(*this == o); }
    bool operator<(const Rational &o) const { return mpq_cmp(q, o.q) < 0; }

    // Nearest binary64 value.
    double to_double() const;
    std::string to_string() const;

private:
    mpq_t q;
};

std::ostream &operator<<(std::ostream &os, const Rational &r);

} // namespace sigqalc

#endif // SIGQALC_INC_RATIONAL_HPP
