#pragma once

#include <optional>
#include <vector>
#include "betaorbit/algebraic_number.hpp"
#include "betaorbit/int_polynomial.hpp"
#include "betaorbit/periodic_sequence.hpp"
#include "betaorbit/types.hpp"

namespace betaorbit {

class CheckpointRegister;

/// Positive divisors of n in ascending order. n must be >= 1.
std::vector<Index> divisors(Index n);

namespace detail {

/**
 * Shared period search once B_k == B_{2k+1} holds for the halfway index
 * k. Tries every divisor d of k+1 in ascending order; for the first d
 * with B_k == B_{k+d}, the preperiod is the first m with B_m == B_{m+d}.
 *
 * `fetch(i)` returns B_i. `first_match(d, limit)` returns the first m in
 * [0, limit) with B_m == B_{m+d}, or -1.
 */
template <class Fetch, class FirstMatch>
std::optional<Period> search_divisors(Index k, const IntPolynomial& halfway,
                                      Fetch&& fetch, FirstMatch&& first_match) {
    for (Index d : divisors(k + 1)) {
        if (halfway != fetch(k + d)) continue;
        Index m = first_match(d, k + 1);
        if (m >= 0) {
            return Period{d, m};
        }
    }
    return std::nullopt;
}

} // namespace detail

/**
 * Period test over the full in-memory prefix B_0..B_{L-1}. Only prefixes
 * of even length L are tested; the halfway index is L/2 - 1.
 */
std::optional<Period> check_periodicity_ram_only(const std::vector<IntPolynomial>& iterates);

/**
 * Same test for the entry at index n, reading history through the
 * register. `halfway` is B_{(n-1)/2} from the halfway cursor and
 * `latest` is B_n. Only odd n are tested.
 */
std::optional<Period> check_periodicity_hybrid(const CheckpointRegister& reg,
                                               const AlgebraicNumber& number,
                                               Index n,
                                               const IntPolynomial& halfway,
                                               const IntPolynomial& latest);

} // namespace betaorbit
