#include "betaorbit/periodicity.hpp"
#include "betaorbit/checkpoint_register.hpp"
#include "betaorbit/error.hpp"

#include <algorithm>

namespace betaorbit {

std::vector<Index> divisors(Index n) {
    BETAORBIT_CHECK_ARGUMENT(n >= 1, "divisors requires n >= 1");

    std::vector<Index> small, large;
    for (Index d = 1; d * d <= n; ++d) {
        if (n % d == 0) {
            small.push_back(d);
            if (d != n / d) large.push_back(n / d);
        }
    }
    small.insert(small.end(), large.rbegin(), large.rend());
    return small;
}

std::optional<Period> check_periodicity_ram_only(const std::vector<IntPolynomial>& iterates) {
    const Index length = static_cast<Index>(iterates.size());
    if (length < 2 || length % 2 != 0) {
        return std::nullopt;
    }

    const Index k = length / 2 - 1;
    const IntPolynomial& halfway = iterates[static_cast<std::size_t>(k)];
    if (iterates.back() != halfway) {
        return std::nullopt;
    }

    auto fetch = [&](Index i) -> const IntPolynomial& {
        return iterates[static_cast<std::size_t>(i)];
    };
    auto first_match = [&](Index d, Index limit) -> Index {
        for (Index m = 0; m < limit; ++m) {
            if (iterates[static_cast<std::size_t>(m)] == iterates[static_cast<std::size_t>(m + d)]) {
                return m;
            }
        }
        return -1;
    };
    return detail::search_divisors(k, halfway, fetch, first_match);
}

std::optional<Period> check_periodicity_hybrid(const CheckpointRegister& reg,
                                               const AlgebraicNumber& number,
                                               Index n,
                                               const IntPolynomial& halfway,
                                               const IntPolynomial& latest) {
    if (n < 1 || n % 2 != 1 || latest != halfway) {
        return std::nullopt;
    }
    const Index k = (n - 1) / 2;

    auto fetch = [&](Index i) {
        return reg.get<IterateSequence>(number, i);
    };
    auto first_match = [&](Index d, Index limit) -> Index {
        auto lower = reg.get_range<IterateSequence>(number, 0, limit);
        auto upper = reg.get_range<IterateSequence>(number, d, d + limit);
        auto a = lower.begin();
        auto b = upper.begin();
        for (; a != lower.end(); ++a, ++b) {
            if (*a == *b) return a.index();
        }
        return -1;
    };
    return detail::search_divisors(k, halfway, fetch, first_match);
}

} // namespace betaorbit
