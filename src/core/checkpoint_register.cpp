/**
 * Checkpoint Register Implementation
 *
 * Disk segments are tracked by the metadata read from their file headers;
 * payloads are read on demand and the most recent one is cached per
 * sequence kind. All file replacement goes through write_segment_file,
 * which renames a finished temporary file into place.
 */

#include "betaorbit/checkpoint_register.hpp"
#include "betaorbit/logging.hpp"
#include "betaorbit/segment_file.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace betaorbit {

namespace fs = std::filesystem;

namespace {

constexpr const char* SUB_REGISTER_INDEX = "subregisters.idx";

bool by_start(const SegmentMetadata& a, const SegmentMetadata& b) {
    return a.start_n < b.start_n;
}

} // anonymous namespace

template <>
CheckpointRegister::SegmentTable<DigitSequence>& CheckpointRegister::table<DigitSequence>() {
    return digits_;
}

template <>
CheckpointRegister::SegmentTable<IterateSequence>& CheckpointRegister::table<IterateSequence>() {
    return iterates_;
}

template <>
const CheckpointRegister::SegmentTable<DigitSequence>& CheckpointRegister::table<DigitSequence>() const {
    return digits_;
}

template <>
const CheckpointRegister::SegmentTable<IterateSequence>& CheckpointRegister::table<IterateSequence>() const {
    return iterates_;
}

// =============================================================================
// Construction and discovery
// =============================================================================

CheckpointRegister::CheckpointRegister(fs::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw IOError("cannot create register directory: " + ec.message(), directory_.string());
    }
    discover();
    load_sub_register_index();
}

std::size_t CheckpointRegister::discover() {
    digits_.disk.clear();
    iterates_.disk.clear();
    digits_.cache.reset();
    iterates_.cache.reset();

    std::size_t found = 0;
    for (const auto& entry : fs::directory_iterator(directory_)) {
        if (!entry.is_regular_file()) continue;
        const fs::path& path = entry.path();

        if (path.extension() == ".tmp") {
            // Left behind by an interrupted write; never renamed, never visible.
            LOG_WARN("removing unfinished segment write ", path.string());
            std::error_code ec;
            fs::remove(path, ec);
            continue;
        }
        if (path.extension() != SEGMENT_EXTENSION) continue;

        try {
            SegmentMetadata meta = read_segment_metadata(path);
            if (meta.kind == SequenceKind::Digit) {
                digits_.disk.push_back(std::move(meta));
            } else {
                iterates_.disk.push_back(std::move(meta));
            }
            ++found;
        } catch (const BetaOrbitException& e) {
            LOG_WARN("skipping unreadable segment ", path.string(), ": ", e.what());
        }
    }

    std::sort(digits_.disk.begin(), digits_.disk.end(), by_start);
    std::sort(iterates_.disk.begin(), iterates_.disk.end(), by_start);

    LOG_DEBUG("discovered ", found, " segments in ", directory_.string());
    return found;
}

void CheckpointRegister::load_sub_register_index() {
    const fs::path index = directory_ / SUB_REGISTER_INDEX;
    if (!fs::exists(index)) return;

    std::ifstream in(index);
    if (!in.is_open()) {
        throw IOError("cannot read sub-register index", index.string());
    }
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            subs_.push_back(std::make_shared<CheckpointRegister>(fs::path(line)));
        } catch (const BetaOrbitException& e) {
            LOG_WARN("cannot open sub-register ", line, ": ", e.what());
        }
    }
}

void CheckpointRegister::save_sub_register_index() const {
    const fs::path index = directory_ / SUB_REGISTER_INDEX;
    const fs::path tmp = directory_ / (std::string(SUB_REGISTER_INDEX) + ".part");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw IOError("cannot write sub-register index", tmp.string());
        }
        for (const auto& sub : subs_) {
            out << fs::absolute(sub->directory()).string() << '\n';
        }
        if (!out) {
            throw IOError("failed writing sub-register index", tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, index, ec);
    if (ec) {
        throw IOError("cannot move sub-register index into place: " + ec.message(), index.string());
    }
}

void CheckpointRegister::add_sub_register(std::shared_ptr<CheckpointRegister> sub) {
    BETAORBIT_CHECK_ARGUMENT(sub != nullptr, "sub-register must not be null");
    BETAORBIT_CHECK_ARGUMENT(sub.get() != this, "a register cannot contain itself");
    subs_.push_back(std::move(sub));
    save_sub_register_index();
}

// =============================================================================
// RAM segments
// =============================================================================

template <class Seq>
void CheckpointRegister::add_ram_segment(std::shared_ptr<RamSegment<Seq>> segment) {
    BETAORBIT_CHECK_ARGUMENT(segment != nullptr, "RAM segment must not be null");
    auto& ram = table<Seq>().ram;
    if (std::find(ram.begin(), ram.end(), segment) == ram.end()) {
        ram.push_back(std::move(segment));
    }
}

template <class Seq>
void CheckpointRegister::remove_ram_segment(const std::shared_ptr<RamSegment<Seq>>& segment) {
    auto& ram = table<Seq>().ram;
    ram.erase(std::remove(ram.begin(), ram.end(), segment), ram.end());
}

// =============================================================================
// Disk segments
// =============================================================================

template <class Seq>
bool CheckpointRegister::has_range(const IntPolynomial& min_poly, Index start_n, Index length) const {
    for (const auto& meta : table<Seq>().disk) {
        if (meta.min_poly == min_poly && meta.start_n == start_n && meta.length == length) {
            return true;
        }
    }
    return false;
}

template <class Seq>
SegmentMetadata CheckpointRegister::add_disk_segment(const AlgebraicNumber& number, Index start_n,
                                                     const std::vector<typename Seq::value_type>& payload,
                                                     std::optional<Period> completion) {
    BETAORBIT_CHECK_ARGUMENT(!payload.empty(), "cannot store an empty segment");
    BETAORBIT_CHECK_ARGUMENT(start_n >= 0, "segment start must be non-negative");

    const Index length = static_cast<Index>(payload.size());
    if (has_range<Seq>(number.min_poly(), start_n, length)) {
        throw DuplicateSegmentError(std::string(to_string(Seq::kind)) + " segment [" +
                                    std::to_string(start_n) + ", " + std::to_string(start_n + length) +
                                    ") already stored",
                                    number.min_poly().to_string());
    }

    SegmentMetadata meta = make_metadata(Seq::kind, number, start_n, length, completion);
    meta.filename = random_segment_filename(directory_);
    write_segment_file<Seq>(directory_, meta, payload);

    auto& disk = table<Seq>().disk;
    disk.insert(std::upper_bound(disk.begin(), disk.end(), meta, by_start), meta);

    LOG_INFO("event=segment_flush kind=", to_string(Seq::kind),
             " start=", start_n, " end=", start_n + length, " file=", meta.filename);
    return meta;
}

template <class Seq>
std::optional<SegmentMetadata> CheckpointRegister::flush(const AlgebraicNumber& number,
                                                         const RamSegment<Seq>& source,
                                                         Index lo, Index hi,
                                                         std::optional<Period> completion) {
    auto payload = source.slice(lo, hi);
    if (payload.empty()) {
        return std::nullopt;
    }
    return add_disk_segment<Seq>(number, std::max(lo, source.start_n()), payload, completion);
}

template <class Seq>
std::vector<SegmentMetadata> CheckpointRegister::disk_segments(const AlgebraicNumber& number) const {
    std::vector<SegmentMetadata> out;
    for (const auto& meta : table<Seq>().disk) {
        if (meta.min_poly == number.min_poly()) out.push_back(meta);
    }
    return out;
}

template <class Seq>
std::shared_ptr<const DiskSegment<Seq>> CheckpointRegister::load(const SegmentMetadata& meta) const {
    auto& cache = table<Seq>().cache;
    if (cache && cache->metadata().filename == meta.filename) {
        return cache;
    }
    cache = std::make_shared<const DiskSegment<Seq>>(read_segment_file<Seq>(directory_ / meta.filename));
    return cache;
}

template <class Seq>
void CheckpointRegister::rewrite_segment(SegmentMetadata& meta, Index new_end,
                                         std::optional<Period> completion) {
    DiskSegment<Seq> current = read_segment_file<Seq>(directory_ / meta.filename);
    const auto& data = current.data();

    SegmentMetadata updated = meta;
    updated.length = new_end - meta.start_n;
    updated.completion = completion;
    std::vector<typename Seq::value_type> kept(data.begin(), data.begin() + updated.length);

    write_segment_file<Seq>(directory_, updated, kept);
    table<Seq>().cache.reset();
    meta = std::move(updated);
}

void CheckpointRegister::remove_segment_file(const SegmentMetadata& meta) {
    std::error_code ec;
    fs::remove(directory_ / meta.filename, ec);
    if (ec) {
        throw IOError("cannot delete segment file: " + ec.message(), (directory_ / meta.filename).string());
    }
    digits_.cache.reset();
    iterates_.cache.reset();
}

// =============================================================================
// Lookups
// =============================================================================

template <class Seq>
std::shared_ptr<const SegmentView<Seq>> CheckpointRegister::locate(const IntPolynomial& min_poly, Index n) const {
    const auto& t = table<Seq>();
    for (const auto& ram : t.ram) {
        if (ram->min_poly() == min_poly && ram->contains(n)) {
            return ram;
        }
    }
    for (const auto& meta : t.disk) {
        if (meta.min_poly == min_poly && meta.contains(n)) {
            return load<Seq>(meta);
        }
    }
    for (const auto& sub : subs_) {
        if (auto found = sub->locate<Seq>(min_poly, n)) {
            return found;
        }
    }
    return nullptr;
}

template <class Seq>
Lookup<typename Seq::value_type> CheckpointRegister::try_get(const AlgebraicNumber& number, Index n) const {
    BETAORBIT_CHECK_ARGUMENT(n >= 0, "negative index " + std::to_string(n));

    Lookup<typename Seq::value_type> result;
    if (auto segment = locate<Seq>(number.min_poly(), n)) {
        result.status = LookupStatus::Found;
        result.value = segment->at(n);
        return result;
    }

    auto period = completion<Seq>(number);
    result.status = (period && n >= period->boundary()) ? LookupStatus::PermanentlyAbsent
                                                        : LookupStatus::NotYetAvailable;
    return result;
}

template <class Seq>
typename Seq::value_type CheckpointRegister::get(const AlgebraicNumber& number, Index n) const {
    auto result = try_get<Seq>(number, n);
    if (!result.found()) {
        throw DataNotFoundError(result.status == LookupStatus::PermanentlyAbsent
                                    ? Availability::PermanentlyAbsent
                                    : Availability::NotYetAvailable,
                                n, std::string(to_string(Seq::kind)) + " of " + number.min_poly().to_string());
    }
    return std::move(*result.value);
}

template <class Seq>
SegmentRange<Seq> CheckpointRegister::get_range(const AlgebraicNumber& number, Index lo, Index hi) const {
    BETAORBIT_CHECK_ARGUMENT(lo >= 0 && lo <= hi, "invalid range [" + std::to_string(lo) + ", " +
                                                  std::to_string(hi) + ")");
    return SegmentRange<Seq>(*this, number.min_poly(), lo, hi);
}

template <class Seq>
std::vector<typename Seq::value_type> CheckpointRegister::get_all(const AlgebraicNumber& number) const {
    Index hi = 0;
    if (auto period = completion<Seq>(number)) {
        hi = period->boundary();
    } else {
        auto ranges = list_known_ranges<Seq>(number);
        if (ranges.empty() || ranges.front().lo != 0) {
            return {};
        }
        hi = ranges.front().hi;
    }

    std::vector<typename Seq::value_type> out;
    out.reserve(static_cast<std::size_t>(hi));
    for (const auto& value : get_range<Seq>(number, 0, hi)) {
        out.push_back(value);
    }
    return out;
}

// =============================================================================
// Completion
// =============================================================================

template <class Seq>
void CheckpointRegister::mark_complete(const AlgebraicNumber& number, Period period) {
    BETAORBIT_CHECK_ARGUMENT(period.p >= 1 && period.m >= 0, "invalid period");

    auto& t = table<Seq>();
    for (auto& ram : t.ram) {
        if (ram->min_poly() == number.min_poly()) {
            ram->set_completion(period);
        }
    }
    for (auto& meta : t.disk) {
        if (meta.min_poly != number.min_poly() || meta.completion == period) continue;
        if (meta.completion) {
            LOG_WARN("replacing completion p=", meta.completion->p, " m=", meta.completion->m,
                     " with p=", period.p, " m=", period.m, " in ", meta.filename);
        }
        rewrite_segment<Seq>(meta, meta.end_n(), period);
    }
    for (auto& sub : subs_) {
        sub->mark_complete<Seq>(number, period);
    }
}

template <class Seq>
std::optional<Period> CheckpointRegister::completion(const AlgebraicNumber& number) const {
    const auto& t = table<Seq>();
    for (const auto& ram : t.ram) {
        if (ram->min_poly() == number.min_poly() && ram->completion()) return ram->completion();
    }
    for (const auto& meta : t.disk) {
        if (meta.min_poly == number.min_poly() && meta.completion) return meta.completion;
    }
    for (const auto& sub : subs_) {
        if (auto period = sub->completion<Seq>(number)) return period;
    }
    return std::nullopt;
}

template <class Seq>
void CheckpointRegister::cleanup_redundancies(const AlgebraicNumber& number) {
    auto& t = table<Seq>();

    for (auto it = t.ram.begin(); it != t.ram.end();) {
        auto& ram = *it;
        if (ram->min_poly() != number.min_poly() || !ram->completion()) {
            ++it;
            continue;
        }
        const Index boundary = ram->completion()->boundary();
        ram->truncate(boundary);
        if (ram->start_n() >= boundary) {
            it = t.ram.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = t.disk.begin(); it != t.disk.end();) {
        if (it->min_poly != number.min_poly() || !it->completion) {
            ++it;
            continue;
        }
        const Index boundary = it->completion->boundary();
        if (it->start_n >= boundary) {
            remove_segment_file(*it);
            it = t.disk.erase(it);
            continue;
        }
        if (it->end_n() > boundary) {
            rewrite_segment<Seq>(*it, boundary, it->completion);
        }
        ++it;
    }

    for (auto& sub : subs_) {
        sub->cleanup_redundancies<Seq>(number);
    }
}

template <class Seq>
PeriodicSequence<typename Seq::value_type> CheckpointRegister::periodic(const AlgebraicNumber& number) const {
    auto period = completion<Seq>(number);
    if (!period) {
        throw DataNotFoundError(Availability::NotYetAvailable, 0,
                                std::string(to_string(Seq::kind)) + " not complete for " +
                                number.min_poly().to_string());
    }
    return PeriodicSequence<typename Seq::value_type>(get_all<Seq>(number), *period);
}

// =============================================================================
// Removal and inventory
// =============================================================================

template <class Seq>
void CheckpointRegister::discard_from(const AlgebraicNumber& number, Index from_n) {
    BETAORBIT_CHECK_ARGUMENT(from_n >= 0, "negative index " + std::to_string(from_n));

    auto& t = table<Seq>();
    for (auto it = t.ram.begin(); it != t.ram.end();) {
        auto& ram = *it;
        if (ram->min_poly() != number.min_poly()) {
            ++it;
            continue;
        }
        ram->truncate(from_n);
        if (ram->start_n() >= from_n) {
            it = t.ram.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = t.disk.begin(); it != t.disk.end();) {
        if (it->min_poly != number.min_poly()) {
            ++it;
            continue;
        }
        if (it->start_n >= from_n) {
            remove_segment_file(*it);
            it = t.disk.erase(it);
            continue;
        }
        if (it->end_n() > from_n) {
            rewrite_segment<Seq>(*it, from_n, it->completion);
        }
        ++it;
    }

    for (auto& sub : subs_) {
        sub->discard_from<Seq>(number, from_n);
    }
}

template <class Seq>
void CheckpointRegister::clear(const AlgebraicNumber& number) {
    discard_from<Seq>(number, 0);
    LOG_DEBUG("cleared ", to_string(Seq::kind), " of ", number.min_poly());
}

template <class Seq>
void CheckpointRegister::collect_ranges(const IntPolynomial& min_poly, std::vector<IndexRange>& out) const {
    const auto& t = table<Seq>();
    for (const auto& ram : t.ram) {
        if (ram->min_poly() == min_poly && ram->length() > 0) {
            out.push_back({ram->start_n(), ram->end_n()});
        }
    }
    for (const auto& meta : t.disk) {
        if (meta.min_poly == min_poly) {
            out.push_back({meta.start_n, meta.end_n()});
        }
    }
    for (const auto& sub : subs_) {
        sub->collect_ranges<Seq>(min_poly, out);
    }
}

template <class Seq>
std::vector<IndexRange> CheckpointRegister::list_known_ranges(const AlgebraicNumber& number) const {
    std::vector<IndexRange> raw;
    collect_ranges<Seq>(number.min_poly(), raw);
    std::sort(raw.begin(), raw.end(),
              [](const IndexRange& a, const IndexRange& b) { return a.lo < b.lo; });

    std::vector<IndexRange> merged;
    for (const auto& r : raw) {
        if (!merged.empty() && r.lo <= merged.back().hi) {
            merged.back().hi = std::max(merged.back().hi, r.hi);
        } else {
            merged.push_back(r);
        }
    }
    return merged;
}

std::vector<IntPolynomial> CheckpointRegister::numbers() const {
    std::vector<IntPolynomial> out;
    auto note = [&out](const IntPolynomial& p) {
        if (std::find(out.begin(), out.end(), p) == out.end()) out.push_back(p);
    };
    for (const auto& meta : digits_.disk) note(meta.min_poly);
    for (const auto& meta : iterates_.disk) note(meta.min_poly);
    for (const auto& ram : digits_.ram) note(ram->min_poly());
    for (const auto& ram : iterates_.ram) note(ram->min_poly());
    for (const auto& sub : subs_) {
        for (const auto& p : sub->numbers()) note(p);
    }
    return out;
}

// =============================================================================
// Explicit instantiations
// =============================================================================

#define BETAORBIT_INSTANTIATE_REGISTER(SEQ)                                                           \
    template void CheckpointRegister::add_ram_segment<SEQ>(std::shared_ptr<RamSegment<SEQ>>);         \
    template void CheckpointRegister::remove_ram_segment<SEQ>(const std::shared_ptr<RamSegment<SEQ>>&); \
    template SegmentMetadata CheckpointRegister::add_disk_segment<SEQ>(                               \
        const AlgebraicNumber&, Index, const std::vector<SEQ::value_type>&, std::optional<Period>);    \
    template std::optional<SegmentMetadata> CheckpointRegister::flush<SEQ>(                           \
        const AlgebraicNumber&, const RamSegment<SEQ>&, Index, Index, std::optional<Period>);         \
    template std::vector<SegmentMetadata> CheckpointRegister::disk_segments<SEQ>(const AlgebraicNumber&) const; \
    template SEQ::value_type CheckpointRegister::get<SEQ>(const AlgebraicNumber&, Index) const;       \
    template Lookup<SEQ::value_type> CheckpointRegister::try_get<SEQ>(const AlgebraicNumber&, Index) const; \
    template SegmentRange<SEQ> CheckpointRegister::get_range<SEQ>(const AlgebraicNumber&, Index, Index) const; \
    template std::vector<SEQ::value_type> CheckpointRegister::get_all<SEQ>(const AlgebraicNumber&) const; \
    template std::shared_ptr<const SegmentView<SEQ>> CheckpointRegister::locate<SEQ>(                 \
        const IntPolynomial&, Index) const;                                                           \
    template void CheckpointRegister::mark_complete<SEQ>(const AlgebraicNumber&, Period);             \
    template std::optional<Period> CheckpointRegister::completion<SEQ>(const AlgebraicNumber&) const; \
    template void CheckpointRegister::cleanup_redundancies<SEQ>(const AlgebraicNumber&);              \
    template PeriodicSequence<SEQ::value_type> CheckpointRegister::periodic<SEQ>(const AlgebraicNumber&) const; \
    template void CheckpointRegister::clear<SEQ>(const AlgebraicNumber&);                             \
    template void CheckpointRegister::discard_from<SEQ>(const AlgebraicNumber&, Index);               \
    template std::vector<IndexRange> CheckpointRegister::list_known_ranges<SEQ>(const AlgebraicNumber&) const;

BETAORBIT_INSTANTIATE_REGISTER(DigitSequence)
BETAORBIT_INSTANTIATE_REGISTER(IterateSequence)

#undef BETAORBIT_INSTANTIATE_REGISTER

} // namespace betaorbit
