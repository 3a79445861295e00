/**
 * Algebraic number root computation.
 *
 * Conjugates come from the eigenvalues of the companion matrix (Eigen,
 * double precision). The dominant eigenvalue seeds a Newton iteration in
 * GMP at precision + extra_precision() bits.
 */

#include "betaorbit/algebraic_number.hpp"
#include "betaorbit/error.hpp"
#include "betaorbit/logging.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace betaorbit {

namespace {

constexpr double MODULUS_TOLERANCE = 1e-9;   // relative, for "equal modulus"
constexpr double UNIT_CIRCLE_TOLERANCE = 1e-7;
constexpr int MAX_NEWTON_ITERATIONS = 200;

bool almost_equal(double a, double b, double tol) {
    return std::fabs(a - b) <= tol * std::max(1.0, std::max(std::fabs(a), std::fabs(b)));
}

bool is_real(const std::complex<double>& z) {
    return std::fabs(z.imag()) <= MODULUS_TOLERANCE * std::max(1.0, std::abs(z));
}

} // anonymous namespace

const char* to_string(NumberClass cls) {
    switch (cls) {
        case NumberClass::Perron: return "Perron";
        case NumberClass::Pisot:  return "Pisot";
        case NumberClass::Salem:  return "Salem";
    }
    return "unknown";
}

AlgebraicNumber::AlgebraicNumber(IntPolynomial min_poly, unsigned precision)
    : min_poly_(std::move(min_poly))
    , precision_(precision) {
    BETAORBIT_CHECK_ARGUMENT(min_poly_.degree() >= 1, "minimal polynomial must have degree >= 1");
    BETAORBIT_CHECK_ARGUMENT(min_poly_.is_monic(), "minimal polynomial must be monic: " + min_poly_.to_string());
    BETAORBIT_CHECK_ARGUMENT(precision_ > 0, "working precision must be positive");
    refine_root();
}

mpz_class AlgebraicNumber::trace() const {
    return -min_poly_.coefficient(static_cast<std::size_t>(degree() - 1));
}

void AlgebraicNumber::set_precision(unsigned precision) {
    BETAORBIT_CHECK_ARGUMENT(precision > 0, "working precision must be positive");
    precision_ = precision;
    refine_root();
}

AlgebraicNumber AlgebraicNumber::with_precision(unsigned precision) const {
    AlgebraicNumber copy(*this);
    copy.set_precision(precision);
    return copy;
}

void AlgebraicNumber::compute_conjugates() {
    const int d = degree();

    // Companion matrix of X^d + a_{d-1} X^{d-1} + ... + a_0
    Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(d, d);
    for (int i = 1; i < d; ++i) {
        companion(i, i - 1) = 1.0;
    }
    for (int i = 0; i < d; ++i) {
        companion(i, d - 1) = -min_poly_.coefficient(static_cast<std::size_t>(i)).get_d();
    }

    Eigen::EigenSolver<Eigen::MatrixXd> solver(companion, false);
    if (solver.info() != Eigen::Success) {
        throw NumericalError("companion eigendecomposition failed", min_poly_.to_string());
    }

    const Eigen::VectorXcd& eigenvalues = solver.eigenvalues();
    conjugates_.assign(eigenvalues.data(), eigenvalues.data() + eigenvalues.size());

    // Decreasing modulus; among equal moduli, larger real part first.
    std::sort(conjugates_.begin(), conjugates_.end(),
              [](const std::complex<double>& a, const std::complex<double>& b) {
                  double ma = std::abs(a), mb = std::abs(b);
                  if (ma != mb) return ma > mb;
                  return a.real() > b.real();
              });

    for (auto& z : conjugates_) {
        if (is_real(z)) z = std::complex<double>(z.real(), 0.0);
    }
}

void AlgebraicNumber::refine_root() {
    if (cached_precision_ == precision_) {
        return;
    }

    if (conjugates_.empty()) {
        compute_conjugates();
    }
    verify(NumberClass::Perron);

    newton_refine(precision_ + extra_precision());
    cached_precision_ = precision_;

    LOG_DEBUG("root refined poly=", min_poly_, " precision=", precision_,
              " beta~", root_.get_d());
}

void AlgebraicNumber::newton_refine(unsigned working_bits) {
    mpf_class x(conjugates_.front().real(), working_bits);
    mpf_class value(0, working_bits), derivative(0, working_bits);
    mpf_class step(0, working_bits), tolerance(0, working_bits);

    int iterations = 0;
    bool converged = false;
    while (iterations < MAX_NEWTON_ITERATIONS) {
        min_poly_.evaluate_with_derivative(x, working_bits, value, derivative);
        if (sgn(derivative) == 0) {
            throw NumericalError("vanishing derivative during root refinement", min_poly_.to_string());
        }
        step = value / derivative;
        x -= step;
        ++iterations;

        // |step| <= |x| 2^-(bits-4)
        tolerance = abs(x);
        mpf_div_2exp(tolerance.get_mpf_t(), tolerance.get_mpf_t(),
                     working_bits > 4 ? working_bits - 4 : 0);
        if (abs(step) <= tolerance) {
            converged = true;
            break;
        }
    }
    if (!converged) {
        throw NumericalError("Newton refinement did not converge in " +
                             std::to_string(MAX_NEWTON_ITERATIONS) + " iterations",
                             min_poly_.to_string());
    }

    // One more step absorbs the error left by the last tested update.
    min_poly_.evaluate_with_derivative(x, working_bits, value, derivative);
    x -= value / derivative;

    root_.set_prec(precision_);
    root_ = x;
}

std::vector<double> AlgebraicNumber::moduli() const {
    std::vector<double> out;
    out.reserve(conjugates_.size());
    for (const auto& z : conjugates_) {
        out.push_back(std::abs(z));
    }
    return out;
}

unsigned AlgebraicNumber::extra_precision() const {
    const double d = static_cast<double>(degree());
    const double beta = conjugates_.empty() ? 2.0 : std::max(1.0, conjugates_.front().real());
    const double height = std::max(1.0, min_poly_.height().get_d());
    return static_cast<unsigned>(std::ceil(std::log2(d)) +
                                 std::ceil(std::log2(height)) +
                                 std::ceil((d - 1.0) * std::log2(beta)));
}

bool AlgebraicNumber::is(NumberClass cls) const {
    if (conjugates_.empty() || !min_poly_.is_monic() || degree() < 1) {
        return false;
    }

    const std::complex<double>& beta = conjugates_.front();
    if (!is_real(beta) || beta.real() <= 1.0) {
        return false;
    }
    if (conjugates_.size() >= 2 &&
        (std::abs(conjugates_[1]) >= beta.real() ||
         almost_equal(std::abs(conjugates_[1]), beta.real(), MODULUS_TOLERANCE))) {
        return false;
    }

    switch (cls) {
        case NumberClass::Perron:
            return true;

        case NumberClass::Pisot:
            for (std::size_t i = 1; i < conjugates_.size(); ++i) {
                if (std::abs(conjugates_[i]) >= 1.0 - MODULUS_TOLERANCE) return false;
            }
            return true;

        case NumberClass::Salem: {
            if (degree() < 4 || degree() % 2 != 0) return false;
            const std::complex<double>& smallest = conjugates_.back();
            if (!is_real(smallest) || smallest.real() <= 0.0 || smallest.real() >= 1.0) {
                return false;
            }
            for (std::size_t i = 1; i + 1 < conjugates_.size(); ++i) {
                if (std::fabs(std::abs(conjugates_[i]) - 1.0) > UNIT_CIRCLE_TOLERANCE) return false;
            }
            return true;
        }
    }
    return false;
}

void AlgebraicNumber::verify(NumberClass cls) const {
    if (!is(cls)) {
        std::ostringstream ctx;
        ctx << "min_poly=" << min_poly_ << " conjugates=";
        for (const auto& z : conjugates_) ctx << z << ' ';
        throw NotPerronError(std::string("not a ") + betaorbit::to_string(cls) + " number", ctx.str());
    }
}

NumberClass AlgebraicNumber::classify() const {
    if (is(NumberClass::Pisot)) return NumberClass::Pisot;
    if (is(NumberClass::Salem)) return NumberClass::Salem;
    return NumberClass::Perron;
}

std::size_t AlgebraicNumber::hash() const {
    std::size_t h = min_poly_.hash();
    h ^= static_cast<std::size_t>(precision_) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

std::string AlgebraicNumber::to_string() const {
    std::ostringstream ss;
    ss << min_poly_ << " @" << precision_ << "b beta~" << root_.get_d();
    return ss.str();
}

mpf_class beta_expansion_sum(const AlgebraicNumber& number,
                             const std::vector<Digit>& digits,
                             std::size_t count) {
    const unsigned prec = number.precision();
    mpf_class inv(1, prec);
    inv /= number.root();
    mpf_class weight(inv, prec);
    mpf_class sum(0, prec);

    count = std::min(count, digits.size());
    for (std::size_t i = 0; i < count; ++i) {
        sum += mpf_class(static_cast<double>(digits[i]), prec) * weight;
        weight *= inv;
    }
    return sum;
}

} // namespace betaorbit
