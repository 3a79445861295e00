#include "betaorbit/memory_monitor.hpp"
#include "betaorbit/error.hpp"
#include "betaorbit/logging.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <sys/sysinfo.h>

namespace betaorbit {

MemoryMonitor::MemoryMonitor(Sampler sampler, std::size_t window)
    : sampler_(std::move(sampler))
    , window_(std::max<std::size_t>(window, 2)) {
    BETAORBIT_CHECK_ARGUMENT(static_cast<bool>(sampler_), "memory sampler must be callable");
}

std::optional<std::uint64_t> MemoryMonitor::parse_meminfo_available(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string key;
        std::uint64_t value = 0;
        std::string unit;
        if (!(fields >> key) || key != "MemAvailable:") continue;
        if (!(fields >> value)) return std::nullopt;
        fields >> unit;
        if (unit == "kB") return value * 1024;
        if (unit.empty()) return value;
        return std::nullopt;
    }
    return std::nullopt;
}

std::uint64_t MemoryMonitor::system_available_bytes() {
    std::ifstream meminfo("/proc/meminfo");
    if (meminfo.is_open()) {
        if (auto available = parse_meminfo_available(meminfo)) return *available;
    }

    struct sysinfo info;
    if (sysinfo(&info) != 0) {
        LOG_WARN("sysinfo() failed; reporting no available memory");
        return 0;
    }
    return (static_cast<std::uint64_t>(info.freeram) + info.bufferram) * info.mem_unit;
}

std::uint64_t MemoryMonitor::sample(Index n) {
    std::uint64_t available = sampler_();
    samples_.emplace_back(n, available);
    while (samples_.size() > window_) {
        samples_.pop_front();
    }
    return available;
}

std::optional<std::uint64_t> MemoryMonitor::last_available() const {
    if (samples_.empty()) return std::nullopt;
    return samples_.back().second;
}

bool MemoryMonitor::has_headroom(std::uint64_t needed_bytes) const {
    auto available = last_available();
    return available && *available > needed_bytes;
}

std::optional<Index> MemoryMonitor::estimate_remaining_iterates(std::uint64_t needed_bytes) const {
    if (samples_.size() < 2) return std::nullopt;

    // Bytes consumed per iterate between consecutive samples.
    std::vector<double> rates;
    for (std::size_t i = 1; i < samples_.size(); ++i) {
        const Index steps = samples_[i].first - samples_[i - 1].first;
        if (steps <= 0) continue;
        const double consumed = static_cast<double>(samples_[i - 1].second) -
                                static_cast<double>(samples_[i].second);
        rates.push_back(consumed / static_cast<double>(steps));
    }
    if (rates.empty()) return std::nullopt;

    auto mid = rates.begin() + static_cast<std::ptrdiff_t>(rates.size() / 2);
    std::nth_element(rates.begin(), mid, rates.end());
    double median = *mid;
    if (rates.size() % 2 == 0) {
        double lower = *std::max_element(rates.begin(), mid);
        median = (median + lower) / 2.0;
    }
    if (median <= 0.0) return std::nullopt;

    const double available = static_cast<double>(samples_.back().second);
    const double headroom = available - static_cast<double>(needed_bytes);
    if (headroom <= 0.0) return Index{0};
    return static_cast<Index>(headroom / median);
}

} // namespace betaorbit
