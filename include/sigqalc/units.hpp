// units.hpp
// Dimensional signature: unit symbol -> exact exponent.
// Zero exponents are dropped on construction, so equal maps mean equal units.

#ifndef SIGQALC_INC_UNITS_HPP
#define SIGQALC_INC_UNITS_HPP

#include <iosfwd>
#include <map>
#include <string>

#include "sigqalc/rational.hpp"

namespace sigqalc {

class Units {
public:
    // std::map keeps symbols sorted, which is also the rendering order.
    using ExponentMap = std::map<std::string, Rational>;

    Units() = default;
    explicit Units(ExponentMap exponents);

    static const Units &none();
    static Units of(const std::string &symbol, const Rational &exponent = Rational::one());

    const ExponentMap &exponents() const { return exps; }
    Rational exponent_of(const std::string &symbol) const;
    bool is_dimensionless() const { return exps.empty(); }

    Units multiply(const Units &o) const;
    Units divide(const Units &o) const;
    Units invert() const;
    Units pow(const Rational &factor) const;

    // "kg m^2 s^-2": sorted by symbol, exponent 1 written as the bare symbol.
    std::string to_string() const;

    bool operator==(const Units &o) const { return exps == o.exps; }
    bool operator!=(const Units &o) const { return !(*this == o); }

private:
    ExponentMap exps;
};

inline Units operator*(const Units &a, const Units &b) { return a.multiply(b); }
inline Units operator/(const Units &a, const Units &b) { return a.divide(b); }

std::ostream &operator<<(std::ostream &os, const Units &u);

} // namespace sigqalc

#endif // SIGQALC_INC_UNITS_HPP
