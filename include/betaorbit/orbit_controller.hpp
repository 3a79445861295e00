#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "betaorbit/algebraic_number.hpp"
#include "betaorbit/checkpoint_register.hpp"
#include "betaorbit/config.hpp"
#include "betaorbit/int_polynomial.hpp"
#include "betaorbit/memory_monitor.hpp"
#include "betaorbit/periodic_sequence.hpp"
#include "betaorbit/types.hpp"

namespace betaorbit {

/**
 * Parameters of one orbit job.
 */
struct OrbitJob {
    Index start_n = 0;                          // first index to produce; > 0 resumes from the register
    Index max_n = 1000000;                      // last index to produce
    int max_restarts = 4;                       // precision doublings allowed
    unsigned starting_precision = 64;           // bits
    Index save_period = 100000;                 // flush cadence in iterates
    Index check_memory_period = 200000;         // memory sampling cadence, >= save_period
    std::uint64_t needed_bytes = 1ULL << 30;    // switch to hybrid below this much free memory
    unsigned guard_bits = DEFAULT_GUARD_BITS;

    /// Reads the orbit.* keys of the configuration.
    static OrbitJob from_config(const Config& config = Config::getInstance());

    /// Throws InvalidArgumentError for inconsistent parameters.
    void validate() const;
};

enum class OrbitStatus {
    Found,
    Exhausted,
    PrecisionFailed
};

const char* to_string(OrbitStatus status);

struct OrbitOutcome {
    OrbitStatus status = OrbitStatus::Exhausted;
    std::optional<Period> period;
    unsigned final_precision = 0;
    int restarts = 0;
    Index last_index = -1;          // last index produced by the final attempt
    bool switched_to_hybrid = false;
    double elapsed_seconds = 0.0;
};

/**
 * Orchestration Controller
 *
 * Drives iterator, detector and register for one number:
 *
 *   Starting -> RAM-only -> (memory pressure) RAM+disk -> Found | Exhausted
 *
 * An AccuracyError discards the attempt's data from start_n on, doubles
 * the precision and starts again, at most max_restarts times; after that
 * the job ends PrecisionFailed.
 */
class OrbitController {
public:
    /// Called with (index, precision) before each step of the main cursor.
    using StepObserver = std::function<void(Index, unsigned)>;

    explicit OrbitController(std::shared_ptr<CheckpointRegister> reg,
                             MemoryMonitor monitor = MemoryMonitor());

    void set_step_observer(StepObserver observer) { observer_ = std::move(observer); }

    OrbitOutcome run(const IntPolynomial& min_poly, const OrbitJob& job);

    CheckpointRegister& checkpoint_register() { return *reg_; }
    MemoryMonitor& memory_monitor() { return monitor_; }

private:
    OrbitOutcome attempt(const AlgebraicNumber& number, const OrbitJob& job);

    std::shared_ptr<CheckpointRegister> reg_;
    MemoryMonitor monitor_;
    StepObserver observer_;
};

/// Result of the purely in-memory search.
struct RamOnlyOutcome {
    OrbitStatus status = OrbitStatus::Exhausted;
    std::optional<PeriodicSequence<Digit>> digits;
    std::optional<PeriodicSequence<IntPolynomial>> iterates;
    unsigned final_precision = 0;
    int restarts = 0;
};

/**
 * Computes the orbit up to max_n entirely in memory, with the same
 * precision-restart policy as OrbitController.
 */
RamOnlyOutcome calc_period_ram_only(const IntPolynomial& min_poly, Index max_n,
                                    int max_restarts, unsigned starting_precision,
                                    unsigned guard_bits = DEFAULT_GUARD_BITS);

} // namespace betaorbit
