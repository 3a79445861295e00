// =============================================================================
// Periodicity Detector Tests
// =============================================================================

#include <gtest/gtest.h>
#include "betaorbit/checkpoint_register.hpp"
#include "betaorbit/orbit_iterator.hpp"
#include "betaorbit/periodicity.hpp"
#include "orbit_fixtures.hpp"

using namespace betaorbit;
using namespace betaorbit::testing_fixtures;

namespace {

// m distinct leading values followed by a cycle of p values
std::vector<IntPolynomial> synthetic(Index m, Index p, Index length) {
    std::vector<IntPolynomial> out;
    for (Index i = 0; i < length; ++i) {
        long v = i < m ? 1000 + i : (i - m) % p;
        out.push_back(IntPolynomial{v, 1});
    }
    return out;
}

// First even prefix length at which the RAM-only test fires
std::optional<std::pair<Index, Period>> first_detection(const std::vector<IntPolynomial>& seq) {
    std::vector<IntPolynomial> prefix;
    for (const auto& b : seq) {
        prefix.push_back(b);
        if (auto period = check_periodicity_ram_only(prefix)) {
            return std::make_pair(static_cast<Index>(prefix.size()), *period);
        }
    }
    return std::nullopt;
}

} // namespace

TEST(Divisors, Ascending) {
    EXPECT_EQ(divisors(1), (std::vector<Index>{1}));
    EXPECT_EQ(divisors(2), (std::vector<Index>{1, 2}));
    EXPECT_EQ(divisors(4), (std::vector<Index>{1, 2, 4}));
    EXPECT_EQ(divisors(6), (std::vector<Index>{1, 2, 3, 6}));
    EXPECT_EQ(divisors(9), (std::vector<Index>{1, 3, 9}));
    EXPECT_EQ(divisors(10), (std::vector<Index>{1, 2, 5, 10}));
    EXPECT_EQ(divisors(97), (std::vector<Index>{1, 97}));
    EXPECT_THROW(divisors(0), InvalidArgumentError);
}

TEST(RamOnlyPeriodicity, OddAndShortPrefixesAreSkipped) {
    auto seq = synthetic(0, 1, 5);
    EXPECT_FALSE(check_periodicity_ram_only({}));
    EXPECT_FALSE(check_periodicity_ram_only({seq[0]}));
    EXPECT_FALSE(check_periodicity_ram_only({seq[0], seq[1], seq[2]}));
    EXPECT_TRUE(check_periodicity_ram_only({seq[0], seq[1]}));
}

TEST(RamOnlyPeriodicity, FindsMinimalShapeOfSyntheticSequences) {
    const std::vector<Period> shapes = {
        {1, 0}, {1, 1}, {1, 5}, {2, 0}, {3, 2}, {4, 3}, {6, 0}, {5, 7}, {12, 1}, {7, 11},
    };
    for (const Period& shape : shapes) {
        auto seq = synthetic(shape.m, shape.p, 4 * (shape.m + shape.p) + 8);
        auto hit = first_detection(seq);
        ASSERT_TRUE(hit.has_value()) << "p=" << shape.p << " m=" << shape.m;
        EXPECT_EQ(hit->second, shape) << "p=" << shape.p << " m=" << shape.m;
        // The halfway index k must lie in the periodic part with p | k+1
        Index k = hit->first / 2 - 1;
        EXPECT_GE(k, shape.m);
        EXPECT_EQ((k + 1) % shape.p, 0);
    }
}

TEST(RamOnlyPeriodicity, KnownOrbits) {
    for (const auto& orbit : all_known_orbits()) {
        AlgebraicNumber beta(orbit.min_poly, 64);
        OrbitIterator it(beta);
        std::vector<IntPolynomial> iterates;
        std::optional<Period> found;
        while (!found && iterates.size() < 200) {
            iterates.push_back(it.next().iterate);
            found = check_periodicity_ram_only(iterates);
        }
        ASSERT_TRUE(found.has_value()) << orbit.name;
        EXPECT_EQ(*found, orbit.period) << orbit.name;
    }
}

TEST(RamOnlyPeriodicity, GoldenSquareDetectedAtLengthFour) {
    auto orbit = golden_square();
    PeriodicSequence<IntPolynomial> seq(orbit.iterates, orbit.period);
    std::vector<IntPolynomial> prefix = {seq[0], seq[1]};
    EXPECT_FALSE(check_periodicity_ram_only(prefix));
    prefix.push_back(seq[2]);
    prefix.push_back(seq[3]);
    auto found = check_periodicity_ram_only(prefix);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, (Period{1, 1}));
}

// Hybrid detection reads the history through a register holding the
// first part on disk and the rest in a RAM segment.
class HybridPeriodicityTest : public ::testing::Test {
protected:
    TempDir dir_{"hybrid"};
    AlgebraicNumber number_{golden_square().min_poly, 64};
};

TEST_F(HybridPeriodicityTest, AgreesWithRamOnly) {
    const std::vector<Period> shapes = {{1, 0}, {3, 2}, {4, 3}, {5, 7}, {7, 11}};
    for (const Period& shape : shapes) {
        CheckpointRegister reg(dir_.path() / ("p" + std::to_string(shape.p) + "m" + std::to_string(shape.m)));
        auto seq = synthetic(shape.m, shape.p, 4 * (shape.m + shape.p) + 8);
        const Index split = 5;

        std::vector<IntPolynomial> head(seq.begin(), seq.begin() + split);
        reg.add_disk_segment<IterateSequence>(number_, 0, head);
        auto ram = std::make_shared<RamSegment<IterateSequence>>(number_, split);
        reg.add_ram_segment(ram);

        auto expected = first_detection(seq);
        ASSERT_TRUE(expected.has_value());

        std::optional<Period> found;
        Index n = 0;
        for (; n < static_cast<Index>(seq.size()); ++n) {
            if (n >= split) ram->append(seq[static_cast<std::size_t>(n)]);
            if (n % 2 == 0) continue;
            const auto& halfway = seq[static_cast<std::size_t>((n - 1) / 2)];
            found = check_periodicity_hybrid(reg, number_, n, halfway, seq[static_cast<std::size_t>(n)]);
            if (found) break;
        }
        ASSERT_TRUE(found.has_value()) << "p=" << shape.p << " m=" << shape.m;
        EXPECT_EQ(*found, expected->second);
        EXPECT_EQ(n + 1, expected->first);
        reg.remove_ram_segment(ram);
    }
}

TEST_F(HybridPeriodicityTest, EvenIndexOrMismatchIsNotTested) {
    CheckpointRegister reg(dir_.path() / "empty");
    IntPolynomial b{1, 1};
    // Nothing is stored, so any lookup would throw
    EXPECT_FALSE(check_periodicity_hybrid(reg, number_, 4, b, b));
    EXPECT_FALSE(check_periodicity_hybrid(reg, number_, 0, b, b));
    EXPECT_FALSE(check_periodicity_hybrid(reg, number_, 5, b, IntPolynomial{2, 1}));
    EXPECT_THROW(check_periodicity_hybrid(reg, number_, 5, b, b), DataNotFoundError);
}
