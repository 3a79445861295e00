// =============================================================================
// Known orbits shared by the test suites
// =============================================================================

#pragma once

#include "betaorbit/int_polynomial.hpp"
#include "betaorbit/periodic_sequence.hpp"
#include "betaorbit/types.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace betaorbit {
namespace testing_fixtures {

struct KnownOrbit {
    const char* name;
    IntPolynomial min_poly;
    double beta;
    std::vector<IntPolynomial> iterates;   // B_0 .. B_{m+p-1}
    std::vector<Digit> digits;             // c_0 .. c_{m+p-1}
    Period period;
};

// x^4 - x^3 - x^2 - 2x - 1, a Pisot number (Boyd)
inline KnownOrbit boyd_quartic() {
    return {
        "boyd_quartic",
        IntPolynomial{-1, -2, -1, -1, 1},
        2.0659948920164738,
        {
            IntPolynomial{1},
            IntPolynomial{-2, 1},
            IntPolynomial{0, -2, 1},
            IntPolynomial{0, 0, -2, 1},
            IntPolynomial{1, 2, 1, -1},
            IntPolynomial{-2, -1, 1},
            IntPolynomial{0, -2, -1, 1},
            IntPolynomial{1, 2, -1},
            IntPolynomial{-1, 1, 2, -1},
            IntPolynomial{-2, -3, 0, 1},
        },
        {2, 0, 0, 0, 1, 0, 0, 1, 1, 1},
        Period{7, 3},
    };
}

// x^4 - 2x^3 + x^2 - x - 1, Perron with a complex pair of modulus ~1.04
inline KnownOrbit perron_quartic() {
    return {
        "perron_quartic",
        IntPolynomial{-1, -1, 1, -2, 1},
        1.8971794010653943,
        {
            IntPolynomial{1},
            IntPolynomial{-1, 1},
            IntPolynomial{-1, -1, 1},
            IntPolynomial{-1, -1, -1, 1},
            IntPolynomial{1, 0, -2, 1},
            IntPolynomial{0, 2, -1},
            IntPolynomial{0, 0, 2, -1},
        },
        {1, 1, 1, 0, 1, 0, 0},
        Period{5, 2},
    };
}

// x^2 - 3x + 1: 1 = 2/β + Σ 1/β^k, preperiod 1, period 1
inline KnownOrbit golden_square() {
    return {
        "golden_square",
        IntPolynomial{1, -3, 1},
        2.6180339887498949,
        {
            IntPolynomial{1},
            IntPolynomial{-2, 1},
        },
        {2, 1},
        Period{1, 1},
    };
}

// x^2 - x - 1: 1 = 1/β + 1/β^2 exactly, the orbit reaches zero
inline KnownOrbit golden_ratio() {
    return {
        "golden_ratio",
        IntPolynomial{-1, -1, 1},
        1.6180339887498949,
        {
            IntPolynomial{1},
            IntPolynomial{-1, 1},
            IntPolynomial{},
        },
        {1, 1, 0},
        Period{1, 2},
    };
}

inline std::vector<KnownOrbit> all_known_orbits() {
    return {boyd_quartic(), perron_quartic(), golden_square(), golden_ratio()};
}

// Degree 6 Salem number whose orbit nearly hits an integer at low precision
inline IntPolynomial salem_sextic() {
    return IntPolynomial{1, -10, -40, -59, -40, -10, 1};
}

/// Fresh empty directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("betaorbit_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace testing_fixtures
} // namespace betaorbit
