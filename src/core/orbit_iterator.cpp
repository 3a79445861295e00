#include "betaorbit/orbit_iterator.hpp"
#include "betaorbit/error.hpp"
#include "betaorbit/logging.hpp"

#include <utility>

namespace betaorbit {

OrbitIterator::OrbitIterator(const AlgebraicNumber& number, Index max_n, unsigned guard_bits)
    : number_(number)
    , max_n_(max_n)
    , guard_bits_(guard_bits)
    , iterate_(IntPolynomial::one()) {
    BETAORBIT_CHECK_ARGUMENT(max_n_ >= 0, "max_n must be non-negative");
}

void OrbitIterator::reseed(IntPolynomial iterate, Index n) {
    BETAORBIT_CHECK_ARGUMENT(n >= 0, "orbit index must be non-negative");
    BETAORBIT_CHECK_ARGUMENT(n <= max_n_, "start index " + std::to_string(n) +
                                          " exceeds max_n " + std::to_string(max_n_));
    BETAORBIT_CHECK_ARGUMENT(iterate.degree() < number_.degree(),
                             "iterate degree must be below the minimal polynomial degree");
    iterate_ = std::move(iterate);
    n_ = n;
}

OrbitStep OrbitIterator::next() {
    if (!has_next()) {
        throw InvalidArgumentError("orbit iterator exhausted at max_n " + std::to_string(max_n_));
    }

    const unsigned prec = number_.precision();
    const IntPolynomial& modulus = number_.min_poly();

    OrbitStep step{n_, 0, mpf_class(0, prec), iterate_};
    IntPolynomial successor;

    if (iterate_.is_zero()) {
        // xi = 0 exactly; the orbit has terminated.
        successor = IntPolynomial();
    } else {
        const mpf_class& beta = number_.root();

        step.xi = beta * iterate_.evaluate(beta, prec);

        mpf_class floor_xi(0, prec);
        mpf_floor(floor_xi.get_mpf_t(), step.xi.get_mpf_t());
        mpf_class frac(step.xi - floor_xi, prec);
        mpz_class c(floor_xi);

        mpf_class eps(1, prec);
        if (prec > guard_bits_) {
            mpf_div_2exp(eps.get_mpf_t(), eps.get_mpf_t(), prec - guard_bits_);
        } else {
            mpf_mul_2exp(eps.get_mpf_t(), eps.get_mpf_t(), guard_bits_ - prec);
        }
        mpf_class value(0, prec), derivative(0, prec);
        mpf_class shifted(beta + eps, prec);
        iterate_.shift_sub(0).evaluate_with_derivative(shifted, prec, value, derivative);
        mpf_class eta(eps * abs(derivative), prec);

        if (frac <= eta) {
            successor = iterate_.shift_sub(c).reduce_once(modulus);
            if (!successor.is_zero()) {
                throw AccuracyError(prec, n_, "frac(xi)=" + std::to_string(frac.get_d()) +
                                              " eta=" + std::to_string(eta.get_d()));
            }
        } else if (mpf_class(1 - frac, prec) <= eta) {
            IntPolynomial rounded_up = iterate_.shift_sub(c + 1).reduce_once(modulus);
            if (rounded_up.is_zero()) {
                c += 1;
                successor = std::move(rounded_up);
            } else {
                successor = iterate_.shift_sub(c).reduce_once(modulus);
            }
        } else {
            successor = iterate_.shift_sub(c).reduce_once(modulus);
        }

        if (sgn(c) < 0 || !c.fits_slong_p()) {
            throw AccuracyError(prec, n_, "digit out of range: " + c.get_str());
        }
        step.digit = static_cast<Digit>(c.get_si());
    }

    iterate_ = std::move(successor);
    ++n_;
    return step;
}

} // namespace betaorbit
