#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "betaorbit/algebraic_number.hpp"
#include "betaorbit/error.hpp"
#include "betaorbit/int_polynomial.hpp"
#include "betaorbit/periodic_sequence.hpp"
#include "betaorbit/types.hpp"

namespace betaorbit {

// =============================================================================
// Sequence kinds
// =============================================================================

enum class SequenceKind : std::uint8_t {
    Digit = 1,
    Iterate = 2
};

const char* to_string(SequenceKind kind);

struct DigitSequence {
    using value_type = Digit;
    static constexpr SequenceKind kind = SequenceKind::Digit;
};

struct IterateSequence {
    using value_type = IntPolynomial;
    static constexpr SequenceKind kind = SequenceKind::Iterate;
};

/// Half-open index interval [lo, hi).
struct IndexRange {
    Index lo = 0;
    Index hi = 0;

    Index length() const { return hi - lo; }
    bool operator==(const IndexRange& other) const { return lo == other.lo && hi == other.hi; }
    bool operator!=(const IndexRange& other) const { return !(*this == other); }
};

// =============================================================================
// Metadata-only segment
// =============================================================================

/**
 * Everything known about a stored segment without its payload. Disk
 * segments are indexed by these records; the payload file is only read
 * when an entry inside the range is requested.
 */
struct SegmentMetadata {
    SequenceKind kind = SequenceKind::Digit;
    IntPolynomial min_poly;
    unsigned precision = 0;
    std::string root;                    // decimal digits of the cached root
    Index start_n = 0;
    Index length = 0;
    std::optional<Period> completion;
    std::string filename;                // relative to the register directory

    Index end_n() const { return start_n + length; }
    bool contains(Index n) const { return n >= start_n && n < end_n(); }
    bool same_range(const SegmentMetadata& other) const {
        return start_n == other.start_n && length == other.length;
    }
};

SegmentMetadata make_metadata(SequenceKind kind, const AlgebraicNumber& number,
                              Index start_n, Index length,
                              std::optional<Period> completion = std::nullopt);

// =============================================================================
// Payload-resident segments
// =============================================================================

/// Read access shared by RAM and loaded disk segments.
template <class Seq>
class SegmentView {
public:
    using value_type = typename Seq::value_type;

    virtual ~SegmentView() = default;

    virtual Index start_n() const = 0;
    virtual Index length() const = 0;
    virtual const value_type& at(Index n) const = 0;

    Index end_n() const { return start_n() + length(); }
    bool contains(Index n) const { return n >= start_n() && n < end_n(); }
};

/**
 * Growable in-memory buffer for one sequence of one number. The
 * controller appends to it every step and registers it so lookups see
 * the newest data before it is flushed.
 */
template <class Seq>
class RamSegment : public SegmentView<Seq> {
public:
    using value_type = typename Seq::value_type;

    RamSegment(const AlgebraicNumber& number, Index start_n)
        : min_poly_(number.min_poly())
        , precision_(number.precision())
        , start_n_(start_n) {
        BETAORBIT_CHECK_ARGUMENT(start_n >= 0, "segment start must be non-negative");
    }

    Index start_n() const override { return start_n_; }
    Index length() const override { return static_cast<Index>(data_.size()); }

    const value_type& at(Index n) const override {
        if (!this->contains(n)) {
            throw DataNotFoundError(Availability::NotYetAvailable, n, "RamSegment::at");
        }
        return data_[static_cast<std::size_t>(n - start_n_)];
    }

    void append(value_type value) { data_.push_back(std::move(value)); }
    void reserve(std::size_t n) { data_.reserve(n); }

    /// Contents of [lo, hi), clamped to the stored range.
    std::vector<value_type> slice(Index lo, Index hi) const {
        lo = std::max(lo, start_n_);
        hi = std::min(hi, this->end_n());
        if (lo >= hi) return {};
        auto first = data_.begin() + (lo - start_n_);
        return std::vector<value_type>(first, first + (hi - lo));
    }

    /// Drops every entry before `new_start`.
    void trim_front(Index new_start) {
        if (new_start <= start_n_) return;
        Index drop = std::min(new_start - start_n_, length());
        data_.erase(data_.begin(), data_.begin() + drop);
        start_n_ = new_start;
    }

    /// Drops every entry at or after `new_end`.
    void truncate(Index new_end) {
        if (new_end >= this->end_n()) return;
        data_.resize(static_cast<std::size_t>(std::max<Index>(0, new_end - start_n_)));
    }

    const std::vector<value_type>& data() const { return data_; }
    const IntPolynomial& min_poly() const { return min_poly_; }
    unsigned precision() const { return precision_; }

    const std::optional<Period>& completion() const { return completion_; }
    void set_completion(Period period) { completion_ = period; }

private:
    IntPolynomial min_poly_;
    unsigned precision_;
    Index start_n_;
    std::vector<value_type> data_;
    std::optional<Period> completion_;
};

/// Payload of a disk segment, loaded on demand and immutable.
template <class Seq>
class DiskSegment : public SegmentView<Seq> {
public:
    using value_type = typename Seq::value_type;

    DiskSegment(SegmentMetadata metadata, std::vector<value_type> data)
        : metadata_(std::move(metadata))
        , data_(std::move(data)) {
        if (static_cast<Index>(data_.size()) != metadata_.length) {
            throw FormatError("payload length " + std::to_string(data_.size()) +
                              " does not match metadata length " + std::to_string(metadata_.length),
                              metadata_.filename);
        }
    }

    Index start_n() const override { return metadata_.start_n; }
    Index length() const override { return metadata_.length; }

    const value_type& at(Index n) const override {
        if (!this->contains(n)) {
            throw DataNotFoundError(Availability::NotYetAvailable, n, "DiskSegment::at");
        }
        return data_[static_cast<std::size_t>(n - metadata_.start_n)];
    }

    const SegmentMetadata& metadata() const { return metadata_; }
    const std::vector<value_type>& data() const { return data_; }

private:
    SegmentMetadata metadata_;
    std::vector<value_type> data_;
};

} // namespace betaorbit
