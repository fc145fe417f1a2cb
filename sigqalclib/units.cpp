// units.cpp
// Exponent bookkeeping over unit symbols. Every operation builds a fresh map
// and hands it to the constructor, which drops zero exponents.

#include "sigqalc/units.hpp"

#include <ostream>
#include <sstream>
#include <utility>

namespace sigqalc {

static Units::ExponentMap drop_zero_exponents(Units::ExponentMap exps) {
    for (auto it = exps.begin(); it != exps.end();) {
        if (it->second.is_zero()) it = exps.erase(it);
        else ++it;
    }
    return exps;
}

Units::Units(ExponentMap exponents) : exps(drop_zero_exponents(std::move(exponents))) {}

const Units &Units::none() {
    static const Units u;
    return u;
}

Units Units::of(const std::string &symbol, const Rational &exponent) {
    ExponentMap m;
    m.emplace(symbol, exponent);
    return Units(std::move(m));
}

Rational Units::exponent_of(const std::string &symbol) const {
    auto it = exps.find(symbol);
    return it == exps.end() ? Rational::zero() : it->second;
}

Units Units::multiply(const Units &o) const {
    ExponentMap m = exps;
    for (const auto &kv : o.exps) {
        auto it = m.find(kv.first);
        if (it == m.end()) m.emplace(kv.first, kv.second);
        else it->second = it->second + kv.second;
    }
    return Units(std::move(m));
}

Units Units::divide(const Units &o) const {
    ExponentMap m = exps;
    for (const auto &kv : o.exps) {
        auto it = m.find(kv.first);
        if (it == m.end()) m.emplace(kv.first, -kv.second);
        else it->second = it->second - kv.second;
    }
    return Units(std::move(m));
}

Units Units::invert() const {
    ExponentMap m;
    for (const auto &kv : exps) m.emplace(kv.first, -kv.second);
    return Units(std::move(m));
}

Units Units::pow(const Rational &factor) const {
    ExponentMap m;
    for (const auto &kv : exps) m.emplace(kv.first, kv.second * factor);
    return Units(std::move(m));
}

std::string Units::to_string() const {
    std::ostringstream ss;
    bool first = true;
    for (const auto &kv : exps) {
        if (!first) ss << " ";
        first = false;
        ss << kv.first;
        if (kv.second != Rational::one()) ss << "^" << kv.second.to_string();
    }
    return ss.str();
}

std::ostream &operator<<(std::ostream &os, const Units &u) {
    return os << u.to_string();
}

} // namespace sigqalc
