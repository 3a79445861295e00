/**
 * Orchestration Controller Implementation
 *
 * One attempt at a fixed precision runs the main cursor from start_n to
 * max_n. In RAM-only mode the whole orbit stays in a RamSegment and the
 * RAM-only detector runs every step. Once memory runs short (or when
 * resuming) the RAM segments keep only the unflushed tail and a second
 * cursor supplies B_{(n-1)/2} for the hybrid detector.
 */

#include "betaorbit/orbit_controller.hpp"
#include "betaorbit/error.hpp"
#include "betaorbit/logging.hpp"
#include "betaorbit/orbit_iterator.hpp"
#include "betaorbit/periodicity.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace betaorbit {

namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

/// Registers an attempt's RAM segments and withdraws them on every exit path.
class RamRegistration {
public:
    RamRegistration(CheckpointRegister& reg,
                    std::shared_ptr<RamSegment<DigitSequence>> digits,
                    std::shared_ptr<RamSegment<IterateSequence>> iterates)
        : reg_(reg), digits_(std::move(digits)), iterates_(std::move(iterates)) {
        reg_.add_ram_segment(digits_);
        reg_.add_ram_segment(iterates_);
    }

    ~RamRegistration() {
        reg_.remove_ram_segment(digits_);
        reg_.remove_ram_segment(iterates_);
    }

    RamRegistration(const RamRegistration&) = delete;
    RamRegistration& operator=(const RamRegistration&) = delete;

private:
    CheckpointRegister& reg_;
    std::shared_ptr<RamSegment<DigitSequence>> digits_;
    std::shared_ptr<RamSegment<IterateSequence>> iterates_;
};

/**
 * Cursor positioned so that its next() yields B_{(n-1)/2} when the main
 * cursor produces the first odd n >= next_n. Seeded from the register
 * entry at floor((next_n - 1) / 2).
 */
OrbitIterator make_halfway_cursor(const CheckpointRegister& reg, const AlgebraicNumber& number,
                                  Index next_n, unsigned guard_bits) {
    OrbitIterator cursor(number, OrbitIterator::NO_LIMIT, guard_bits);
    if (next_n == 0) {
        return cursor;
    }
    const Index k = (next_n - 1) / 2;
    cursor.reseed(reg.get<IterateSequence>(number, k), k);
    if (next_n % 2 == 0) {
        cursor.next();
    }
    return cursor;
}

} // anonymous namespace

// =============================================================================
// OrbitJob
// =============================================================================

OrbitJob OrbitJob::from_config(const Config& config) {
    OrbitJob job;
    job.max_n = config.get<std::int64_t>("orbit.max_n", job.max_n);
    job.max_restarts = config.get<int>("orbit.max_restarts", job.max_restarts);
    job.starting_precision = config.get<unsigned>("orbit.starting_precision", job.starting_precision);
    job.save_period = config.get<std::int64_t>("orbit.save_period", job.save_period);
    job.check_memory_period = config.get<std::int64_t>("orbit.check_memory_period", job.check_memory_period);
    job.needed_bytes = config.get<std::uint64_t>("orbit.needed_bytes", job.needed_bytes);
    job.guard_bits = config.get<unsigned>("orbit.guard_bits", job.guard_bits);
    return job;
}

void OrbitJob::validate() const {
    BETAORBIT_CHECK_ARGUMENT(start_n >= 0, "start_n must be non-negative");
    BETAORBIT_CHECK_ARGUMENT(max_n >= 0, "max_n must be non-negative");
    BETAORBIT_CHECK_ARGUMENT(start_n <= max_n, "start_n (" + std::to_string(start_n) +
                                               ") exceeds max_n (" + std::to_string(max_n) + ")");
    BETAORBIT_CHECK_ARGUMENT(max_restarts >= 0, "max_restarts must be non-negative");
    BETAORBIT_CHECK_ARGUMENT(starting_precision > 0, "starting_precision must be positive");
    BETAORBIT_CHECK_ARGUMENT(save_period >= 1, "save_period must be positive");
    BETAORBIT_CHECK_ARGUMENT(check_memory_period >= save_period,
                             "check_memory_period must be at least save_period");
}

const char* to_string(OrbitStatus status) {
    switch (status) {
        case OrbitStatus::Found:           return "found";
        case OrbitStatus::Exhausted:       return "exhausted";
        case OrbitStatus::PrecisionFailed: return "precision_failed";
    }
    return "unknown";
}

// =============================================================================
// OrbitController
// =============================================================================

OrbitController::OrbitController(std::shared_ptr<CheckpointRegister> reg, MemoryMonitor monitor)
    : reg_(std::move(reg))
    , monitor_(std::move(monitor)) {
    BETAORBIT_CHECK_ARGUMENT(reg_ != nullptr, "controller requires a register");
}

OrbitOutcome OrbitController::run(const IntPolynomial& min_poly, const OrbitJob& job) {
    job.validate();
    const auto start = Clock::now();
    AlgebraicNumber number(min_poly, job.starting_precision);

    if (auto known = reg_->completion<IterateSequence>(number)) {
        LOG_INFO("orbit of ", min_poly, " already complete p=", known->p, " m=", known->m);
        OrbitOutcome outcome;
        outcome.status = OrbitStatus::Found;
        outcome.period = known;
        outcome.final_precision = number.precision();
        return outcome;
    }

    LOG_INFO("orbit job poly=", min_poly, " start_n=", job.start_n, " max_n=", job.max_n,
             " precision=", job.starting_precision, " beta~", number.root_estimate());

    // Indices from start_n on are recomputed by this job.
    const auto stored = reg_->list_known_ranges<IterateSequence>(number);
    if (!stored.empty() && stored.back().hi > job.start_n) {
        LOG_INFO("discarding stored orbit data from index ", job.start_n,
                 " (known up to ", stored.back().hi, ")");
    }
    reg_->discard_from<IterateSequence>(number, job.start_n);
    reg_->discard_from<DigitSequence>(number, job.start_n);

    for (int restart = 0;; ++restart) {
        try {
            monitor_.reset();
            OrbitOutcome outcome = attempt(number, job);
            outcome.restarts = restart;
            outcome.elapsed_seconds = seconds_since(start);
            return outcome;
        } catch (const AccuracyError& e) {
            reg_->discard_from<IterateSequence>(number, job.start_n);
            reg_->discard_from<DigitSequence>(number, job.start_n);

            if (restart >= job.max_restarts) {
                LOG_WARN("event=precision_failed index=", e.index(), " precision=", number.precision(),
                         " restarts=", restart, " elapsed=", seconds_since(start), "s");
                OrbitOutcome outcome;
                outcome.status = OrbitStatus::PrecisionFailed;
                outcome.final_precision = number.precision();
                outcome.restarts = restart;
                outcome.last_index = e.index();
                outcome.elapsed_seconds = seconds_since(start);
                return outcome;
            }

            const unsigned next_precision = number.precision() * 2;
            LOG_WARN("event=precision_restart index=", e.index(), " precision=", number.precision(),
                     " next_precision=", next_precision, " elapsed=", seconds_since(start), "s");
            number.set_precision(next_precision);
        }
    }
}

OrbitOutcome OrbitController::attempt(const AlgebraicNumber& number, const OrbitJob& job) {
    const auto start = Clock::now();
    const unsigned precision = number.precision();

    OrbitOutcome outcome;
    outcome.final_precision = precision;

    auto digits = std::make_shared<RamSegment<DigitSequence>>(number, job.start_n);
    auto iterates = std::make_shared<RamSegment<IterateSequence>>(number, job.start_n);
    RamRegistration registration(*reg_, digits, iterates);

    OrbitIterator cursor(number, job.max_n, job.guard_bits);
    std::optional<OrbitIterator> halfway;
    bool hybrid = false;

    if (job.start_n > 0) {
        const Index seed = job.start_n - 1;
        cursor.reseed(reg_->get<IterateSequence>(number, seed), seed);
        cursor.next();
        halfway = make_halfway_cursor(*reg_, number, job.start_n, job.guard_bits);
        hybrid = true;
        LOG_INFO("resuming at index ", job.start_n, " in RAM+disk mode");
    } else {
        const std::uint64_t available = monitor_.sample(0);
        if (!monitor_.has_headroom(job.needed_bytes)) {
            halfway = make_halfway_cursor(*reg_, number, 0, job.guard_bits);
            hybrid = true;
            outcome.switched_to_hybrid = true;
            LOG_INFO("event=algorithm_switch index=0 available=", available,
                     " needed=", job.needed_bytes);
        }
    }

    Index flushed_to = job.start_n;

    while (cursor.has_next()) {
        const Index n = cursor.index();
        if (observer_) {
            observer_(n, precision);
        }

        OrbitStep step = cursor.next();
        digits->append(step.digit);
        iterates->append(std::move(step.iterate));

        std::optional<Period> found;
        if (!hybrid) {
            found = check_periodicity_ram_only(iterates->data());
        } else if (n % 2 == 1) {
            OrbitStep mid = halfway->next();
            found = check_periodicity_hybrid(*reg_, number, n, mid.iterate, iterates->at(n));
        }

        if (found) {
            const Index end = std::min(n + 1, found->boundary());
            reg_->flush(number, *digits, flushed_to, end, found);
            reg_->flush(number, *iterates, flushed_to, end, found);
            reg_->mark_complete<DigitSequence>(number, *found);
            reg_->mark_complete<IterateSequence>(number, *found);
            reg_->cleanup_redundancies<DigitSequence>(number);
            reg_->cleanup_redundancies<IterateSequence>(number);

            outcome.status = OrbitStatus::Found;
            outcome.period = found;
            outcome.last_index = n;
            LOG_INFO("event=period_found p=", found->p, " m=", found->m, " index=", n,
                     " precision=", precision, " elapsed=", seconds_since(start), "s");
            return outcome;
        }

        if (n % job.save_period == job.save_period - 1) {
            reg_->flush(number, *digits, flushed_to, n + 1);
            reg_->flush(number, *iterates, flushed_to, n + 1);
            flushed_to = n + 1;
            if (hybrid) {
                digits->trim_front(flushed_to);
                iterates->trim_front(flushed_to);
            }
        }

        if (n % job.check_memory_period == job.check_memory_period - 1) {
            const std::uint64_t available = monitor_.sample(n);
            const auto estimate = monitor_.estimate_remaining_iterates(job.needed_bytes);
            LOG_DEBUG("memory index=", n, " available=", available,
                      " iterates_left~", estimate ? *estimate : Index{-1});

            if (!hybrid && !monitor_.has_headroom(job.needed_bytes)) {
                halfway = make_halfway_cursor(*reg_, number, n + 1, job.guard_bits);
                digits->trim_front(flushed_to);
                iterates->trim_front(flushed_to);
                hybrid = true;
                outcome.switched_to_hybrid = true;
                LOG_INFO("event=algorithm_switch index=", n, " available=", available,
                         " needed=", job.needed_bytes,
                         " iterates_left~", estimate ? *estimate : Index{-1});
            }
        }
    }

    reg_->flush(number, *digits, flushed_to, job.max_n + 1);
    reg_->flush(number, *iterates, flushed_to, job.max_n + 1);

    outcome.status = OrbitStatus::Exhausted;
    outcome.last_index = job.max_n;
    LOG_WARN("event=orbit_exhausted max_n=", job.max_n, " precision=", precision,
             " elapsed=", seconds_since(start), "s");
    return outcome;
}

// =============================================================================
// RAM-only search
// =============================================================================

RamOnlyOutcome calc_period_ram_only(const IntPolynomial& min_poly, Index max_n,
                                    int max_restarts, unsigned starting_precision,
                                    unsigned guard_bits) {
    BETAORBIT_CHECK_ARGUMENT(max_n >= 0, "max_n must be non-negative");
    BETAORBIT_CHECK_ARGUMENT(max_restarts >= 0, "max_restarts must be non-negative");

    AlgebraicNumber number(min_poly, starting_precision);
    RamOnlyOutcome outcome;

    for (int restart = 0;; ++restart) {
        outcome.final_precision = number.precision();
        outcome.restarts = restart;
        try {
            std::vector<Digit> digits;
            std::vector<IntPolynomial> iterates;
            OrbitIterator cursor(number, max_n, guard_bits);

            while (cursor.has_next()) {
                OrbitStep step = cursor.next();
                digits.push_back(step.digit);
                iterates.push_back(std::move(step.iterate));

                if (auto period = check_periodicity_ram_only(iterates)) {
                    outcome.status = OrbitStatus::Found;
                    outcome.digits.emplace(std::move(digits), *period);
                    outcome.iterates.emplace(std::move(iterates), *period);
                    return outcome;
                }
            }
            outcome.status = OrbitStatus::Exhausted;
            return outcome;
        } catch (const AccuracyError& e) {
            if (restart >= max_restarts) {
                LOG_WARN("event=precision_failed index=", e.index(), " precision=", number.precision());
                outcome.status = OrbitStatus::PrecisionFailed;
                return outcome;
            }
            LOG_WARN("event=precision_restart index=", e.index(), " precision=", number.precision(),
                     " next_precision=", number.precision() * 2);
            number.set_precision(number.precision() * 2);
        }
    }
}

} // namespace betaorbit
