// =============================================================================
// IntPolynomial Tests
// =============================================================================

#include <gtest/gtest.h>
#include "betaorbit/int_polynomial.hpp"

#include <unordered_set>

using namespace betaorbit;

TEST(IntPolynomialTest, TrailingZerosAreTrimmed) {
    IntPolynomial p{3, 0, 2, 0, 0};
    EXPECT_EQ(p.degree(), 2);
    EXPECT_EQ(p, (IntPolynomial{3, 0, 2}));

    IntPolynomial zero{0, 0, 0};
    EXPECT_TRUE(zero.is_zero());
    EXPECT_EQ(zero.degree(), -1);
    EXPECT_EQ(zero, IntPolynomial());
}

TEST(IntPolynomialTest, CoefficientBeyondDegreeIsZero) {
    IntPolynomial p{5, -1};
    EXPECT_EQ(p.coefficient(0), 5);
    EXPECT_EQ(p.coefficient(1), -1);
    EXPECT_EQ(p.coefficient(7), 0);
}

TEST(IntPolynomialTest, ShiftSubMultipliesByXAndSubtracts) {
    IntPolynomial b{1, 2};          // 1 + 2X
    IntPolynomial r = b.shift_sub(3);
    EXPECT_EQ(r, (IntPolynomial{-3, 1, 2}));

    EXPECT_EQ(IntPolynomial().shift_sub(0), IntPolynomial());
    EXPECT_EQ(IntPolynomial().shift_sub(4), (IntPolynomial{-4}));
}

TEST(IntPolynomialTest, ReduceOnceSubtractsLeadingMultiple) {
    IntPolynomial modulus{-1, -1, 1};   // X^2 - X - 1
    IntPolynomial p{0, -1, 1};          // X^2 - X
    EXPECT_EQ(p.reduce_once(modulus), (IntPolynomial{1}));

    IntPolynomial q{2, 0, 3};           // 3X^2 + 2
    EXPECT_EQ(q.reduce_once(modulus), (IntPolynomial{5, 3}));

    IntPolynomial low{4, 7};
    EXPECT_EQ(low.reduce_once(modulus), low);

    EXPECT_TRUE(modulus.reduce_once(modulus).is_zero());
}

TEST(IntPolynomialTest, EvaluateMatchesHorner) {
    IntPolynomial p{1, -3, 1};          // X^2 - 3X + 1
    mpf_class x(2.5, 128);
    mpf_class v = p.evaluate(x, 128);
    EXPECT_DOUBLE_EQ(v.get_d(), 2.5 * 2.5 - 7.5 + 1.0);
}

TEST(IntPolynomialTest, EvaluateWithDerivative) {
    IntPolynomial p{-1, 0, 0, 2};       // 2X^3 - 1
    mpf_class x(1.5, 128), value, derivative;
    p.evaluate_with_derivative(x, 128, value, derivative);
    EXPECT_DOUBLE_EQ(value.get_d(), 2 * 3.375 - 1);
    EXPECT_DOUBLE_EQ(derivative.get_d(), 6 * 2.25);
    EXPECT_GE(value.get_prec(), 128u);
}

TEST(IntPolynomialTest, LargeCoefficientsStayExact) {
    mpz_class big("123456789012345678901234567890");
    IntPolynomial p(std::vector<mpz_class>{big, 1});
    IntPolynomial r = p.shift_sub(big);
    EXPECT_EQ(r.coefficient(0), mpz_class(-big));
    EXPECT_EQ(r.coefficient(1), big);
    EXPECT_EQ(r.height(), big);
}

TEST(IntPolynomialTest, HashAgreesWithEquality) {
    std::unordered_set<IntPolynomial, IntPolynomialHash> seen;
    seen.insert(IntPolynomial{1, 2, 3});
    seen.insert(IntPolynomial{1, 2, 3, 0});
    seen.insert(IntPolynomial{1, 2, -3});
    seen.insert(IntPolynomial());
    EXPECT_EQ(seen.size(), 3u);
}

TEST(IntPolynomialTest, ToString) {
    EXPECT_EQ((IntPolynomial{-1, 0, 2}).to_string(), "(-1, 0, 2)");
    EXPECT_EQ(IntPolynomial().to_string(), "()");
    EXPECT_TRUE((IntPolynomial{1, 0, 1}).is_monic());
    EXPECT_FALSE((IntPolynomial{1, 2}).is_monic());
}
