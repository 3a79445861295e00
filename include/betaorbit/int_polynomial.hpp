#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>
#include <gmpxx.h>

namespace betaorbit {

/**
 * Polynomial with exact integer coefficients, stored low degree first.
 * Trailing zero coefficients are always trimmed, so the zero polynomial
 * has no coefficients and structural equality is polynomial equality.
 */
class IntPolynomial {
public:
    IntPolynomial() = default;
    explicit IntPolynomial(std::vector<mpz_class> coefficients);
    IntPolynomial(std::initializer_list<long> coefficients);

    /// The constant polynomial 1, the first iterate X^0.
    static IntPolynomial one();

    bool is_zero() const { return coeffs_.empty(); }

    /// Degree of the polynomial; -1 for the zero polynomial.
    int degree() const { return static_cast<int>(coeffs_.size()) - 1; }

    /// Coefficient of X^i, zero beyond the degree.
    mpz_class coefficient(std::size_t i) const;
    const mpz_class& leading() const { return coeffs_.back(); }
    const std::vector<mpz_class>& coefficients() const { return coeffs_; }

    bool is_monic() const { return !coeffs_.empty() && coeffs_.back() == 1; }

    /// X·this − c.
    IntPolynomial shift_sub(const mpz_class& c) const;

    /**
     * Reduces a polynomial of degree at most deg(modulus) modulo a monic
     * modulus by subtracting lead·modulus once.
     */
    IntPolynomial reduce_once(const IntPolynomial& modulus) const;

    /// Horner evaluation at x, result carries `precision` bits.
    mpf_class evaluate(const mpf_class& x, unsigned precision) const;

    /// Value and first derivative at x in one Horner pass.
    void evaluate_with_derivative(const mpf_class& x, unsigned precision,
                                  mpf_class& value, mpf_class& derivative) const;

    /// Largest absolute coefficient, zero for the zero polynomial.
    mpz_class height() const;

    std::size_t hash() const;
    std::string to_string() const;

    bool operator==(const IntPolynomial& other) const { return coeffs_ == other.coeffs_; }
    bool operator!=(const IntPolynomial& other) const { return !(*this == other); }

private:
    void trim();

    std::vector<mpz_class> coeffs_;
};

std::ostream& operator<<(std::ostream& os, const IntPolynomial& p);

struct IntPolynomialHash {
    std::size_t operator()(const IntPolynomial& p) const { return p.hash(); }
};

} // namespace betaorbit
