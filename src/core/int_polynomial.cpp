#include "betaorbit/int_polynomial.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace betaorbit {

IntPolynomial::IntPolynomial(std::vector<mpz_class> coefficients)
    : coeffs_(std::move(coefficients)) {
    trim();
}

IntPolynomial::IntPolynomial(std::initializer_list<long> coefficients) {
    coeffs_.reserve(coefficients.size());
    for (long c : coefficients) {
        coeffs_.emplace_back(c);
    }
    trim();
}

IntPolynomial IntPolynomial::one() {
    return IntPolynomial{1};
}

void IntPolynomial::trim() {
    while (!coeffs_.empty() && coeffs_.back() == 0) {
        coeffs_.pop_back();
    }
}

mpz_class IntPolynomial::coefficient(std::size_t i) const {
    return i < coeffs_.size() ? coeffs_[i] : mpz_class(0);
}

IntPolynomial IntPolynomial::shift_sub(const mpz_class& c) const {
    std::vector<mpz_class> out;
    out.reserve(coeffs_.size() + 1);
    out.emplace_back(-c);
    out.insert(out.end(), coeffs_.begin(), coeffs_.end());
    return IntPolynomial(std::move(out));
}

IntPolynomial IntPolynomial::reduce_once(const IntPolynomial& modulus) const {
    if (degree() < modulus.degree()) {
        return *this;
    }
    // Caller guarantees deg(this) == deg(modulus); modulus is monic.
    const mpz_class lead = leading();
    std::vector<mpz_class> out(coeffs_);
    for (std::size_t i = 0; i < modulus.coeffs_.size(); ++i) {
        out[i] -= lead * modulus.coeffs_[i];
    }
    return IntPolynomial(std::move(out));
}

mpf_class IntPolynomial::evaluate(const mpf_class& x, unsigned precision) const {
    mpf_class acc(0, precision);
    for (auto it = coeffs_.rbegin(); it != coeffs_.rend(); ++it) {
        acc *= x;
        acc += mpf_class(*it, precision);
    }
    return acc;
}

void IntPolynomial::evaluate_with_derivative(const mpf_class& x, unsigned precision,
                                             mpf_class& value, mpf_class& derivative) const {
    value.set_prec(precision);
    derivative.set_prec(precision);
    value = 0;
    derivative = 0;
    for (auto it = coeffs_.rbegin(); it != coeffs_.rend(); ++it) {
        derivative *= x;
        derivative += value;
        value *= x;
        value += mpf_class(*it, precision);
    }
}

mpz_class IntPolynomial::height() const {
    mpz_class h = 0;
    for (const auto& c : coeffs_) {
        mpz_class a = abs(c);
        if (a > h) h = a;
    }
    return h;
}

std::size_t IntPolynomial::hash() const {
    std::size_t h = coeffs_.size();
    for (const auto& c : coeffs_) {
        std::size_t limb = mpz_size(c.get_mpz_t()) > 0
            ? static_cast<std::size_t>(mpz_getlimbn(c.get_mpz_t(), 0)) : 0;
        std::size_t v = limb ^ static_cast<std::size_t>(mpz_sgn(c.get_mpz_t()) + 1);
        h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    }
    return h;
}

std::string IntPolynomial::to_string() const {
    std::ostringstream ss;
    ss << '(';
    for (std::size_t i = 0; i < coeffs_.size(); ++i) {
        if (i) ss << ", ";
        ss << coeffs_[i].get_str();
    }
    ss << ')';
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const IntPolynomial& p) {
    return os << p.to_string();
}

} // namespace betaorbit
