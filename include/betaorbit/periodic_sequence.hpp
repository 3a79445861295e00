#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "betaorbit/error.hpp"
#include "betaorbit/types.hpp"

namespace betaorbit {

/// Preperiod m and minimal period p of an eventually periodic sequence.
struct Period {
    Index p = 0;
    Index m = 0;

    /// First index whose entry is redundant.
    Index boundary() const { return p + m; }

    bool operator==(const Period& other) const { return p == other.p && m == other.m; }
    bool operator!=(const Period& other) const { return !(*this == other); }
};

/**
 * Eventually periodic sequence in canonical form: entries 0..m+p-1 are
 * stored, every later index is answered by periodic continuation.
 */
template <class T>
class PeriodicSequence {
public:
    PeriodicSequence(std::vector<T> prefix, Period period)
        : data_(std::move(prefix))
        , period_(period) {
        BETAORBIT_CHECK_ARGUMENT(period_.p >= 1 && period_.m >= 0, "invalid period");
        BETAORBIT_CHECK_ARGUMENT(static_cast<Index>(data_.size()) >= period_.boundary(),
                                 "prefix shorter than preperiod + period");
        data_.resize(static_cast<std::size_t>(period_.boundary()));
    }

    const T& at(Index n) const {
        BETAORBIT_CHECK_ARGUMENT(n >= 0, "negative index");
        if (n >= period_.m) {
            n = period_.m + (n - period_.m) % period_.p;
        }
        return data_[static_cast<std::size_t>(n)];
    }

    const T& operator[](Index n) const { return at(n); }

    Index period() const { return period_.p; }
    Index preperiod() const { return period_.m; }
    const Period& shape() const { return period_; }

    /// The stored m + p entries.
    const std::vector<T>& canonical() const { return data_; }

    bool operator==(const PeriodicSequence& other) const {
        return period_ == other.period_ && data_ == other.data_;
    }
    bool operator!=(const PeriodicSequence& other) const { return !(*this == other); }

private:
    std::vector<T> data_;
    Period period_;
};

} // namespace betaorbit
