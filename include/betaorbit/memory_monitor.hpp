#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <istream>
#include <optional>
#include <utility>
#include "betaorbit/types.hpp"

namespace betaorbit {

/**
 * Polls available system memory at the controller's cadence.
 *
 * Keeps the last `window` samples. The median of the per-iterate
 * consumption between consecutive samples estimates how many further
 * iterates fit before the headroom is used up; that estimate is only
 * logged. The switch decision is the plain threshold in has_headroom().
 */
class MemoryMonitor {
public:
    using Sampler = std::function<std::uint64_t()>;

    explicit MemoryMonitor(Sampler sampler = system_available_bytes, std::size_t window = 16);

    /// Records a sample taken at orbit index n and returns the available bytes.
    std::uint64_t sample(Index n);

    /// Most recent sample, if any.
    std::optional<std::uint64_t> last_available() const;

    bool has_headroom(std::uint64_t needed_bytes) const;

    /**
     * Iterates left before available memory drops to `needed_bytes`, from
     * the median consumption rate. Empty with fewer than two samples or
     * when memory is not being consumed.
     */
    std::optional<Index> estimate_remaining_iterates(std::uint64_t needed_bytes) const;

    void reset() { samples_.clear(); }

    /**
     * The kernel's MemAvailable estimate from /proc/meminfo, which counts
     * reclaimable page cache. Falls back to free plus buffer memory from
     * sysinfo() when the field is missing.
     */
    static std::uint64_t system_available_bytes();

    /// Bytes in the "MemAvailable:" line of /proc/meminfo-formatted text.
    static std::optional<std::uint64_t> parse_meminfo_available(std::istream& in);

private:
    Sampler sampler_;
    std::size_t window_;
    std::deque<std::pair<Index, std::uint64_t>> samples_;
};

} // namespace betaorbit
