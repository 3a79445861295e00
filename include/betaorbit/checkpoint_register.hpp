#pragma once

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "betaorbit/algebraic_number.hpp"
#include "betaorbit/error.hpp"
#include "betaorbit/periodic_sequence.hpp"
#include "betaorbit/segment.hpp"
#include "betaorbit/types.hpp"

namespace betaorbit {

enum class LookupStatus {
    Found,
    NotYetAvailable,
    PermanentlyAbsent
};

/// Non-throwing lookup result.
template <class T>
struct Lookup {
    LookupStatus status = LookupStatus::NotYetAvailable;
    std::optional<T> value;

    bool found() const { return status == LookupStatus::Found; }
};

class CheckpointRegister;

/**
 * Lazy view of [lo, hi) of one sequence. Each dereference resolves
 * through the register; the segment holding the current index is kept
 * until the iterator leaves it, so a disk payload is read once per pass.
 */
template <class Seq>
class SegmentRange {
public:
    using value_type = typename Seq::value_type;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename Seq::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        iterator() = default;
        iterator(const SegmentRange* range, Index n) : range_(range), n_(n) {}

        /// Throws DataNotFoundError if no source covers the current index.
        reference operator*() const;
        pointer operator->() const { return &**this; }

        iterator& operator++() { ++n_; return *this; }
        iterator operator++(int) { iterator tmp = *this; ++n_; return tmp; }

        Index index() const { return n_; }

        bool operator==(const iterator& other) const { return n_ == other.n_; }
        bool operator!=(const iterator& other) const { return n_ != other.n_; }

    private:
        const SegmentRange* range_ = nullptr;
        Index n_ = 0;
        mutable std::shared_ptr<const SegmentView<Seq>> current_;
    };

    SegmentRange(const CheckpointRegister& reg, IntPolynomial min_poly, Index lo, Index hi)
        : reg_(&reg), min_poly_(std::move(min_poly)), lo_(lo), hi_(hi) {}

    iterator begin() const { return iterator(this, lo_); }
    iterator end() const { return iterator(this, hi_); }

    Index lo() const { return lo_; }
    Index hi() const { return hi_; }
    Index size() const { return hi_ - lo_; }

private:
    const CheckpointRegister* reg_;
    IntPolynomial min_poly_;
    Index lo_;
    Index hi_;
};

/**
 * Checkpoint Register
 *
 * Segmented store of orbit data, one directory per register. For every
 * (sequence kind, number) it tracks RAM segments registered by a running
 * controller and disk segments described by metadata read from segment
 * file headers. Lookups try RAM segments, then disk segments, then the
 * attached sub-registers.
 *
 * Numbers are matched by minimal polynomial: digits and iterates are
 * exact data and do not depend on the precision that produced them.
 *
 * Writes only ever target this register's own directory. Completion,
 * cleanup and clearing propagate into sub-registers.
 */
class CheckpointRegister {
public:
    /// Opens (creating if needed) a register directory and discovers its segments.
    explicit CheckpointRegister(std::filesystem::path directory);

    CheckpointRegister(const CheckpointRegister&) = delete;
    CheckpointRegister& operator=(const CheckpointRegister&) = delete;

    const std::filesystem::path& directory() const { return directory_; }

    // -------------------------------------------------------------------------
    // RAM segments
    // -------------------------------------------------------------------------

    template <class Seq>
    void add_ram_segment(std::shared_ptr<RamSegment<Seq>> segment);

    template <class Seq>
    void remove_ram_segment(const std::shared_ptr<RamSegment<Seq>>& segment);

    // -------------------------------------------------------------------------
    // Disk segments
    // -------------------------------------------------------------------------

    /**
     * Writes [start_n, start_n + payload.size()) as a new disk segment and
     * returns its metadata. Throws InvalidArgumentError for an empty
     * payload and DuplicateSegmentError if the exact range is already
     * stored for this number in this register's own directory. Ranges
     * held by sub-registers do not count: writes only target this one.
     */
    template <class Seq>
    SegmentMetadata add_disk_segment(const AlgebraicNumber& number, Index start_n,
                                     const std::vector<typename Seq::value_type>& payload,
                                     std::optional<Period> completion = std::nullopt);

    /// Flushes [lo, hi) of a RAM segment to disk. Returns nullopt when the slice is empty.
    template <class Seq>
    std::optional<SegmentMetadata> flush(const AlgebraicNumber& number, const RamSegment<Seq>& source,
                                         Index lo, Index hi,
                                         std::optional<Period> completion = std::nullopt);

    template <class Seq>
    std::vector<SegmentMetadata> disk_segments(const AlgebraicNumber& number) const;

    // -------------------------------------------------------------------------
    // Lookups
    // -------------------------------------------------------------------------

    /// Throws InvalidArgumentError for n < 0 and DataNotFoundError on a miss.
    template <class Seq>
    typename Seq::value_type get(const AlgebraicNumber& number, Index n) const;

    template <class Seq>
    Lookup<typename Seq::value_type> try_get(const AlgebraicNumber& number, Index n) const;

    template <class Seq>
    SegmentRange<Seq> get_range(const AlgebraicNumber& number, Index lo, Index hi) const;

    /// Entries [0, m+p) if complete, else the contiguous known prefix from 0.
    template <class Seq>
    std::vector<typename Seq::value_type> get_all(const AlgebraicNumber& number) const;

    /// Segment covering n, or nullptr. Used by SegmentRange.
    template <class Seq>
    std::shared_ptr<const SegmentView<Seq>> locate(const IntPolynomial& min_poly, Index n) const;

    // -------------------------------------------------------------------------
    // Completion
    // -------------------------------------------------------------------------

    template <class Seq>
    void mark_complete(const AlgebraicNumber& number, Period period);

    template <class Seq>
    std::optional<Period> completion(const AlgebraicNumber& number) const;

    /// Removes every stored entry at index >= m + p.
    template <class Seq>
    void cleanup_redundancies(const AlgebraicNumber& number);

    /// Throws DataNotFoundError(NotYetAvailable) if the sequence is not complete.
    template <class Seq>
    PeriodicSequence<typename Seq::value_type> periodic(const AlgebraicNumber& number) const;

    // -------------------------------------------------------------------------
    // Removal and inventory
    // -------------------------------------------------------------------------

    /// Deletes all RAM and disk data of this kind for the number.
    template <class Seq>
    void clear(const AlgebraicNumber& number);

    /// Deletes every entry at index >= from_n, slicing a straddling segment.
    template <class Seq>
    void discard_from(const AlgebraicNumber& number, Index from_n);

    /// Sorted, merged intervals covered by any source.
    template <class Seq>
    std::vector<IndexRange> list_known_ranges(const AlgebraicNumber& number) const;

    /// Minimal polynomials with at least one stored segment.
    std::vector<IntPolynomial> numbers() const;

    // -------------------------------------------------------------------------
    // Composition and discovery
    // -------------------------------------------------------------------------

    /// Attaches a register for reads; persisted in the directory's index.
    void add_sub_register(std::shared_ptr<CheckpointRegister> sub);
    const std::vector<std::shared_ptr<CheckpointRegister>>& sub_registers() const { return subs_; }

    /// Rebuilds the disk metadata from segment file headers. Returns the count found.
    std::size_t discover();

private:
    template <class Seq>
    struct SegmentTable {
        std::vector<std::shared_ptr<RamSegment<Seq>>> ram;
        std::vector<SegmentMetadata> disk;
        mutable std::shared_ptr<const DiskSegment<Seq>> cache;
    };

    template <class Seq>
    SegmentTable<Seq>& table();

    template <class Seq>
    const SegmentTable<Seq>& table() const;

    template <class Seq>
    std::shared_ptr<const DiskSegment<Seq>> load(const SegmentMetadata& meta) const;

    template <class Seq>
    bool has_range(const IntPolynomial& min_poly, Index start_n, Index length) const;

    template <class Seq>
    void collect_ranges(const IntPolynomial& min_poly, std::vector<IndexRange>& out) const;

    template <class Seq>
    void rewrite_segment(SegmentMetadata& meta, Index new_end, std::optional<Period> completion);

    void remove_segment_file(const SegmentMetadata& meta);
    void load_sub_register_index();
    void save_sub_register_index() const;

    std::filesystem::path directory_;
    SegmentTable<DigitSequence> digits_;
    SegmentTable<IterateSequence> iterates_;
    std::vector<std::shared_ptr<CheckpointRegister>> subs_;
};

// =============================================================================
// SegmentRange implementation
// =============================================================================

template <class Seq>
typename SegmentRange<Seq>::iterator::reference SegmentRange<Seq>::iterator::operator*() const {
    if (!current_ || !current_->contains(n_)) {
        current_ = range_->reg_->template locate<Seq>(range_->min_poly_, n_);
        if (!current_) {
            throw DataNotFoundError(Availability::NotYetAvailable, n_, "SegmentRange");
        }
    }
    return current_->at(n_);
}

} // namespace betaorbit
