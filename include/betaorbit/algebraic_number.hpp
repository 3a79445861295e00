#pragma once

#include <complex>
#include <cstddef>
#include <string>
#include <vector>
#include <gmpxx.h>
#include "betaorbit/int_polynomial.hpp"
#include "betaorbit/types.hpp"

namespace betaorbit {

enum class NumberClass {
    Perron,
    Pisot,
    Salem
};

const char* to_string(NumberClass cls);

/**
 * Real algebraic number β > 1 given by its minimal polynomial, together
 * with a numeric approximation of β at an explicit working precision.
 *
 * The approximation is computed in two stages: Eigen gives all
 * conjugates of the companion matrix in double precision, then Newton's
 * method in GMP refines the dominant one to the working precision plus
 * extra_precision() bits.
 *
 * Two numbers compare equal when minimal polynomial and precision match;
 * the cached approximation takes no part in equality.
 */
class AlgebraicNumber {
public:
    /// Throws InvalidArgumentError unless min_poly is monic of degree >= 1.
    AlgebraicNumber(IntPolynomial min_poly, unsigned precision);

    const IntPolynomial& min_poly() const { return min_poly_; }
    int degree() const { return min_poly_.degree(); }
    unsigned precision() const { return precision_; }

    /// Sum of the conjugates, i.e. minus the X^(d-1) coefficient.
    mpz_class trace() const;

    /**
     * Recomputes the dominant root if the working precision changed
     * since the last computation. Throws NotPerronError when no real
     * root > 1 strictly dominates the other conjugates.
     */
    void refine_root();

    /// Changes the working precision and refines the root accordingly.
    void set_precision(unsigned precision);
    AlgebraicNumber with_precision(unsigned precision) const;

    /// Dominant root, valid to precision() bits.
    const mpf_class& root() const { return root_; }
    double root_estimate() const { return root_.get_d(); }

    /// All conjugates (β first), ordered by decreasing modulus.
    const std::vector<std::complex<double>>& conjugates() const { return conjugates_; }
    std::vector<double> moduli() const;

    /// Bits added during refinement to absorb the cancellation in p(β).
    unsigned extra_precision() const;

    /// True when the conjugates satisfy the constraints of `cls`.
    bool is(NumberClass cls) const;

    /// Throws NotPerronError when is(cls) fails.
    void verify(NumberClass cls) const;

    /// Most specific class satisfied: Pisot, then Salem, else Perron.
    NumberClass classify() const;

    std::size_t hash() const;
    std::string to_string() const;

    bool operator==(const AlgebraicNumber& other) const {
        return precision_ == other.precision_ && min_poly_ == other.min_poly_;
    }
    bool operator!=(const AlgebraicNumber& other) const { return !(*this == other); }

private:
    void compute_conjugates();
    void newton_refine(unsigned working_bits);

    IntPolynomial min_poly_;
    unsigned precision_;
    unsigned cached_precision_ = 0;  // 0 = nothing cached yet
    mpf_class root_;
    std::vector<std::complex<double>> conjugates_;
};

struct AlgebraicNumberHash {
    std::size_t operator()(const AlgebraicNumber& n) const { return n.hash(); }
};

/**
 * Partial sum of the first `count` digits of the β-expansion of 1,
 * Σ c_i β^-(i+1), evaluated at the number's working precision. Tends to 1.
 */
mpf_class beta_expansion_sum(const AlgebraicNumber& number,
                             const std::vector<Digit>& digits,
                             std::size_t count);

} // namespace betaorbit
