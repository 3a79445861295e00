#pragma once

#include <limits>
#include <gmpxx.h>
#include "betaorbit/algebraic_number.hpp"
#include "betaorbit/int_polynomial.hpp"
#include "betaorbit/types.hpp"

namespace betaorbit {

/**
 * One produced orbit entry: the iterate B_n = X^n mod p(X), the digit
 * c_n = floor(xi_n) and xi_n = β·B_n(β) itself.
 */
struct OrbitStep {
    Index n;
    Digit digit;
    mpf_class xi;
    IntPolynomial iterate;
};

/**
 * Cursor over the orbit of 1 under x -> frac(βx), tracked exactly through
 * the iterates B_n. Holds only the current (B, n); any number of cursors
 * can walk the same orbit independently after reseed().
 *
 * Each step bounds the evaluation error by
 *     eta = eps * |(X·B)'(β + eps)|,  eps = 2^(guard_bits - precision)
 * and refuses to emit a digit when frac(xi) <= eta. Exact integer values
 * of xi are recognised by testing the candidate remainder for zero.
 */
class OrbitIterator {
public:
    static constexpr Index NO_LIMIT = std::numeric_limits<Index>::max();

    /// Starts at (B_0 = 1, n = 0). `max_n` is the last index produced.
    explicit OrbitIterator(const AlgebraicNumber& number,
                           Index max_n = NO_LIMIT,
                           unsigned guard_bits = DEFAULT_GUARD_BITS);

    /// Continue from B_n = iterate at index n.
    void reseed(IntPolynomial iterate, Index n);

    bool has_next() const { return n_ <= max_n_; }

    /**
     * Emits the entry for the current index and advances to the next.
     * Throws AccuracyError if the working precision cannot decide the
     * digit, InvalidArgumentError past max_n.
     */
    OrbitStep next();

    Index index() const { return n_; }
    Index max_n() const { return max_n_; }
    const IntPolynomial& current() const { return iterate_; }
    const AlgebraicNumber& number() const { return number_; }

private:
    AlgebraicNumber number_;
    Index max_n_;
    unsigned guard_bits_;
    IntPolynomial iterate_;
    Index n_ = 0;
};

} // namespace betaorbit
