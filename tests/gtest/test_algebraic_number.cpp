// =============================================================================
// AlgebraicNumber Tests
// =============================================================================

#include <gtest/gtest.h>
#include "betaorbit/algebraic_number.hpp"
#include "betaorbit/error.hpp"
#include "orbit_fixtures.hpp"

#include <cmath>
#include <unordered_set>

using namespace betaorbit;
using namespace betaorbit::testing_fixtures;

class AlgebraicNumberTest : public ::testing::Test {
protected:
    // |root - expected| < 2^-bits, checked at the root's own precision
    static bool close_to_bits(const mpf_class& root, const char* expected, unsigned bits) {
        mpf_class e(expected, bits + 64);
        mpf_class diff(root - e, bits + 64);
        mpf_class tol(1, bits + 64);
        mpf_div_2exp(tol.get_mpf_t(), tol.get_mpf_t(), bits);
        return abs(diff) < tol;
    }
};

TEST_F(AlgebraicNumberTest, RootsOfKnownOrbits) {
    for (const auto& orbit : all_known_orbits()) {
        AlgebraicNumber beta(orbit.min_poly, 64);
        EXPECT_NEAR(beta.root_estimate(), orbit.beta, 1e-12) << orbit.name;
        EXPECT_EQ(beta.degree(), orbit.min_poly.degree());
    }
}

TEST_F(AlgebraicNumberTest, RootAccurateToWorkingPrecision) {
    AlgebraicNumber phi(IntPolynomial{-1, -1, 1}, 256);
    EXPECT_TRUE(close_to_bits(phi.root(),
        "1.6180339887498948482045868343656381177203091798057628621354486227052604628189024497072",
        240));

    // The minimal polynomial nearly vanishes at the refined root.
    mpf_class residual = phi.min_poly().evaluate(phi.root(), 256);
    EXPECT_LT(std::fabs(residual.get_d()), 1e-70);
}

TEST_F(AlgebraicNumberTest, RefineIsIdempotentAndPrecisionChangesRecompute) {
    AlgebraicNumber beta(IntPolynomial{1, -3, 1}, 64);
    mpf_class first = beta.root();
    beta.refine_root();
    EXPECT_TRUE(first == beta.root());

    beta.set_precision(512);
    EXPECT_EQ(beta.precision(), 512u);
    EXPECT_GE(beta.root().get_prec(), 512u);
    EXPECT_TRUE(close_to_bits(beta.root(),
        "2.6180339887498948482045868343656381177203091798057628621354486227052604628189024497072",
        256));
}

TEST_F(AlgebraicNumberTest, EqualityIgnoresCachedRoot) {
    AlgebraicNumber a(IntPolynomial{-1, -1, 1}, 64);
    AlgebraicNumber b(IntPolynomial{-1, -1, 1}, 64);
    AlgebraicNumber c(IntPolynomial{-1, -1, 1}, 128);
    AlgebraicNumber d(IntPolynomial{1, -3, 1}, 64);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_EQ(a.with_precision(128), c);

    std::unordered_set<AlgebraicNumber, AlgebraicNumberHash> set{a, b, c, d};
    EXPECT_EQ(set.size(), 3u);
}

TEST_F(AlgebraicNumberTest, RejectsNonMonicOrConstant) {
    EXPECT_THROW(AlgebraicNumber(IntPolynomial{1, 2}, 64), InvalidArgumentError);
    EXPECT_THROW(AlgebraicNumber(IntPolynomial{5}, 64), InvalidArgumentError);
    EXPECT_THROW(AlgebraicNumber(IntPolynomial(), 64), InvalidArgumentError);
}

TEST_F(AlgebraicNumberTest, RejectsNumbersWithoutDominantRealRoot) {
    // x^2 - 2: conjugates +-sqrt(2) share the dominant modulus
    EXPECT_THROW(AlgebraicNumber(IntPolynomial{-2, 0, 1}, 64), NotPerronError);
    // x^2 + 1: no real root
    EXPECT_THROW(AlgebraicNumber(IntPolynomial{1, 0, 1}, 64), NotPerronError);
    // x^2 + x - 1: the dominant root is -1.618
    EXPECT_THROW(AlgebraicNumber(IntPolynomial{-1, 1, 1}, 64), NotPerronError);
}

TEST_F(AlgebraicNumberTest, Classification) {
    AlgebraicNumber pisot(IntPolynomial{-1, -2, -1, -1, 1}, 64);
    EXPECT_EQ(pisot.classify(), NumberClass::Pisot);
    EXPECT_NO_THROW(pisot.verify(NumberClass::Pisot));
    EXPECT_THROW(pisot.verify(NumberClass::Salem), NotPerronError);

    AlgebraicNumber perron(IntPolynomial{-1, -1, 1, -2, 1}, 64);
    EXPECT_EQ(perron.classify(), NumberClass::Perron);
    EXPECT_FALSE(perron.is(NumberClass::Pisot));

    AlgebraicNumber salem(salem_sextic(), 64);
    EXPECT_EQ(salem.classify(), NumberClass::Salem);
    EXPECT_NEAR(salem.root_estimate(), 13.345638433018787, 1e-10);
    auto moduli = salem.moduli();
    ASSERT_EQ(moduli.size(), 6u);
    EXPECT_NEAR(moduli.back() * moduli.front(), 1.0, 1e-9);
}

TEST_F(AlgebraicNumberTest, IntegerBaseHasDegreeOne) {
    AlgebraicNumber three(IntPolynomial{-3, 1}, 64);
    EXPECT_DOUBLE_EQ(three.root_estimate(), 3.0);
    EXPECT_EQ(three.trace(), 3);
    EXPECT_EQ(three.classify(), NumberClass::Pisot);
}

TEST_F(AlgebraicNumberTest, TraceAndExtraPrecision) {
    AlgebraicNumber salem(salem_sextic(), 64);
    EXPECT_EQ(salem.trace(), 10);
    // ceil(log2 6) + ceil(log2 59) + ceil(5 log2 13.35) = 3 + 6 + 19
    EXPECT_EQ(salem.extra_precision(), 28u);
}

TEST_F(AlgebraicNumberTest, BetaExpansionOfOneSumsToOne) {
    auto orbit = golden_square();
    AlgebraicNumber beta(orbit.min_poly, 128);
    std::vector<Digit> digits{2};
    for (int i = 0; i < 80; ++i) digits.push_back(1);

    mpf_class sum = beta_expansion_sum(beta, digits, digits.size());
    EXPECT_NEAR(sum.get_d(), 1.0, 1e-30);

    mpf_class partial = beta_expansion_sum(beta, digits, 1);
    EXPECT_NEAR(partial.get_d(), 2.0 / orbit.beta, 1e-15);
}
