// decimal.cpp
// Exact base-10 numbers on top of mpz_t. Only what the formatter needs:
// shortest conversion from binary64, half-up rescaling and plain printing.

#include "sigqalc/decimal.hpp"

#include <charconv>
#include <cmath>
#include <cstring>
#include <ostream>
#include <utility>

#include "sigqalc/errors.hpp"

namespace sigqalc {

static const long MAX_EXPONENT_DIGITS = 9;

static std::string mpz_to_string(mpz_srcptr z) {
    std::string out(mpz_sizeinbase(z, 10) + 2, '\0');
    mpz_get_str(&out[0], 10, z);
    out.resize(std::strlen(out.c_str()));
    return out;
}

// pow10 = 10^n, n >= 0
static void set_pow10(mpz_t pow10, long n) {
    mpz_ui_pow_ui(pow10, 10, static_cast<unsigned long>(n));
}

Decimal::Decimal() : scale_(0) { mpz_init(unscaled); }

Decimal::Decimal(long unscaled_value, long scale) : scale_(scale) {
    mpz_init_set_si(unscaled, unscaled_value);
}

Decimal::Decimal(const Decimal &o) : scale_(o.scale_) { mpz_init_set(unscaled, o.unscaled); }

Decimal::Decimal(Decimal &&o) noexcept : scale_(o.scale_) {
    mpz_init(unscaled);
    mpz_swap(unscaled, o.unscaled);
}

Decimal &Decimal::operator=(const Decimal &o) {
    if (this != &o) {
        mpz_set(unscaled, o.unscaled);
        scale_ = o.scale_;
    }
    return *this;
}

Decimal &Decimal::operator=(Decimal &&o) noexcept {
    mpz_swap(unscaled, o.unscaled);
    std::swap(scale_, o.scale_);
    return *this;
}

Decimal::~Decimal() { mpz_clear(unscaled); }

Decimal Decimal::from_double(double v) {
    require(std::isfinite(v), Condition::NonFiniteValue, "cannot convert a non-finite double to decimal");
    // shortest round-trip digits, e.g. "1.2345e+04"
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    if (res.ec != std::errc()) {
        fail_precondition(Condition::MalformedNumber, "to_chars failed");
    }
    return parse(std::string(buf, res.ptr));
}

Decimal Decimal::parse(const std::string &text) {
    size_t i = 0, n = text.size();
    bool negative = false;
    if (i < n && (text[i] == '+' || text[i] == '-')) {
        negative = text[i] == '-';
        ++i;
    }
    std::string digits;
    long frac_digits = 0;
    bool seen_point = false;
    for (; i < n; ++i) {
        char c = text[i];
        if (c >= '0' && c <= '9') {
            digits.push_back(c);
            if (seen_point) ++frac_digits;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
    }
    if (digits.empty()) {
        fail_precondition(Condition::MalformedNumber, "not a decimal: '" + text + "'");
    }
    long exponent = 0;
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        bool exp_negative = false;
        if (i < n && (text[i] == '+' || text[i] == '-')) {
            exp_negative = text[i] == '-';
            ++i;
        }
        size_t start = i;
        for (; i < n && text[i] >= '0' && text[i] <= '9'; ++i) {
            if (static_cast<long>(i - start) >= MAX_EXPONENT_DIGITS) {
                fail_precondition(Condition::MalformedNumber, "exponent out of range: '" + text + "'");
            }
            exponent = exponent * 10 + (text[i] - '0');
        }
        if (i == start) {
            fail_precondition(Condition::MalformedNumber, "missing exponent: '" + text + "'");
        }
        if (exp_negative) exponent = -exponent;
    }
    if (i != n) {
        fail_precondition(Condition::MalformedNumber, "trailing characters in '" + text + "'");
    }

    Decimal r;
    if (mpz_set_str(r.unscaled, digits.c_str(), 10) != 0) {
        fail_precondition(Condition::MalformedNumber, "not a decimal: '" + text + "'");
    }
    if (negative) mpz_neg(r.unscaled, r.unscaled);
    r.scale_ = frac_digits - exponent;
    return r;
}

Decimal Decimal::set_scale_half_up(long new_scale) const {
    if (new_scale == scale_) return *this;

    Decimal r;
    r.scale_ = new_scale;
    mpz_t p;
    mpz_init(p);
    if (new_scale > scale_) {
        set_pow10(p, new_scale - scale_);
        mpz_mul(r.unscaled, unscaled, p);
    } else {
        set_pow10(p, scale_ - new_scale);
        mpz_t rem;
        mpz_init(rem);
        // truncates toward zero; rem carries the sign of the dividend
        mpz_tdiv_qr(r.unscaled, rem, unscaled, p);
        mpz_abs(rem, rem);
        mpz_mul_2exp(rem, rem, 1);
        if (mpz_cmp(rem, p) >= 0) {
            if (signum() > 0) mpz_add_ui(r.unscaled, r.unscaled, 1);
            else mpz_sub_ui(r.unscaled, r.unscaled, 1);
        }
        mpz_clear(rem);
    }
    mpz_clear(p);
    return r;
}

Decimal Decimal::strip_trailing_zeros() const {
    if (is_zero()) return Decimal();
    Decimal r(*this);
    while (mpz_divisible_ui_p(r.unscaled, 10)) {
        mpz_divexact_ui(r.unscaled, r.unscaled, 10);
        --r.scale_;
    }
    return r;
}

Decimal Decimal::scale_by_power_of_ten(long n) const {
    Decimal r(*this);
    r.scale_ -= n;
    return r;
}

std::string Decimal::to_plain_string() const {
    if (is_zero()) {
        return scale_ > 0 ? "0." + std::string(static_cast<size_t>(scale_), '0') : "0";
    }
    mpz_t a;
    mpz_init(a);
    mpz_abs(a, unscaled);
    std::string digits = mpz_to_string(a);
    mpz_clear(a);

    std::string out;
    if (scale_ <= 0) {
        out = digits + std::string(static_cast<size_t>(-scale_), '0');
    } else {
        size_t sc = static_cast<size_t>(scale_);
        if (digits.size() <= sc) digits.insert(0, sc + 1 - digits.size(), '0');
        out = digits.substr(0, digits.size() - sc) + "." + digits.substr(digits.size() - sc);
    }
    return signum() < 0 ? "-" + out : out;
}

std::ostream &operator<<(std::ostream &os, const Decimal &d) {
    return os << d.to_plain_string();
}

} // namespace sigqalc
