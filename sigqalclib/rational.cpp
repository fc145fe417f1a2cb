// rational.cpp
// Thin RAII layer over mpq_t; GMP does the arithmetic, MPFR the binary64 rounding.

#include "sigqalc/rational.hpp"

#include <cstring>
#include <ostream>

#include <mpfr.h>

#include "sigqalc/config.hpp"
#include "sigqalc/errors.hpp"

namespace sigqalc {

Rational::Rational() { mpq_init(q); }

Rational::Rational(long num, long den) {
    if (den == 0) fail_precondition(Condition::ZeroDenominator, "rational " + std::to_string(num) + "/0");
    mpq_init(q);
    // canonicalize moves the sign to the numerator
    mpz_set_si(mpq_numref(q), num);
    mpz_set_si(mpq_denref(q), den);
    mpq_canonicalize(q);
}

Rational::Rational(const std::string &text) {
    mpq_init(q);
    if (text.empty() || mpq_set_str(q, text.c_str(), 10) != 0) {
        mpq_clear(q);
        fail_precondition(Condition::MalformedNumber, "not a rational: '" + text + "'");
    }
    if (mpz_sgn(mpq_denref(q)) == 0) {
        mpq_clear(q);
        fail_precondition(Condition::ZeroDenominator, "rational '" + text + "'");
    }
    mpq_canonicalize(q);
}

Rational::Rational(const Rational &o) {
    mpq_init(q);
    mpq_set(q, o.q);
}

Rational::Rational(Rational &&o) noexcept {
    mpq_init(q);
    mpq_swap(q, o.q);
}

Rational &Rational::operator=(const Rational &o) {
    if (this != &o) mpq_set(q, o.q);
    return *this;
}

Rational &Rational::operator=(Rational &&o) noexcept {
    mpq_swap(q, o.q);
    return *this;
}

Rational::~Rational() { mpq_clear(q); }

const Rational &Rational::zero() {
    static const Rational r(0, 1);
    return r;
}

const Rational &Rational::one() {
    static const Rational r(1, 1);
    return r;
}

const Rational &Rational::half() {
    static const Rational r(1, 2);
    return r;
}

Rational Rational::operator+(const Rational &o) const {
    Rational r;
    mpq_add(r.q, q, o.q);
    return r;
}

Rational Rational::operator-(const Rational &o) const {
    Rational r;
    mpq_sub(r.q, q, o.q);
    return r;
}

Rational Rational::operator*(const Rational &o) const {
    Rational r;
    mpq_mul(r.q, q, o.q);
    return r;
}

Rational Rational::operator-() const {
    Rational r;
    mpq_neg(r.q, q);
    return r;
}

double Rational::to_double() const {
    // mpq_get_d truncates; go through mpfr for round-to-nearest
    mpfr_t f;
    mpfr_init2(f, EXACT_CONVERSION_PREC);
    mpfr_set_q(f, q, MPFR_RNDN);
    double d = mpfr_get_d(f, MPFR_RNDN);
    mpfr_clear(f);
    return d;
}

std::string Rational::to_string() const {
    std::string out(mpz_sizeinbase(mpq_numref(q), 10) + mpz_sizeinbase(mpq_denref(q), 10) + 3, '\0');
    mpq_get_str(&out[0], 10, q);
    out.resize(std::strlen(out.c_str()));
    return out;
}

std::ostream &operator<<(std::ostream &os, const Rational &r) {
    return os << r.to_string();
}

} // namespace sigqalc
