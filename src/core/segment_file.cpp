/**
 * Versioned binary segment files.
 *
 * A segment is written to "<name>.tmp", synced, and renamed to its final
 * name, so a segment file that exists is complete. Every length field is
 * checked against the bytes left in the file before anything is allocated.
 */

#include "betaorbit/segment_file.hpp"
#include "betaorbit/error.hpp"
#include "betaorbit/logging.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace betaorbit {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t FILENAME_LENGTH = 20;
constexpr int FILENAME_ATTEMPTS = 10;
constexpr char FILENAME_ALPHABET[] = "23456789abcdefghijkmnpqrstuvwxyzABCDEFGHJKLMNPQRSTUVWXYZ";  // 56 symbols

// Smallest encodings: an integer is a sign byte and a u32 count, a
// polynomial a u32 count, a digit an i64.
constexpr std::uint64_t MIN_INTEGER_BYTES = 5;
constexpr std::uint64_t MIN_POLYNOMIAL_BYTES = 4;
constexpr std::uint64_t DIGIT_BYTES = 8;

// =============================================================================
// Binary encoding helpers
// =============================================================================

class BinaryWriter {
public:
    explicit BinaryWriter(std::ostream& out) : out_(out) {}

    void u8(std::uint8_t v) { out_.put(static_cast<char>(v)); }

    void u32(std::uint32_t v) {
        char buf[4];
        for (int i = 0; i < 4; ++i) buf[i] = static_cast<char>((v >> (8 * i)) & 0xFF);
        out_.write(buf, 4);
    }

    void i64(std::int64_t v) {
        std::uint64_t u = static_cast<std::uint64_t>(v);
        char buf[8];
        for (int i = 0; i < 8; ++i) buf[i] = static_cast<char>((u >> (8 * i)) & 0xFF);
        out_.write(buf, 8);
    }

    void string(const std::string& s) {
        u32(static_cast<std::uint32_t>(s.size()));
        out_.write(s.data(), static_cast<std::streamsize>(s.size()));
    }

    void integer(const mpz_class& z) {
        int sign = sgn(z);
        u8(sign == 0 ? 0 : (sign > 0 ? 1 : 2));
        if (sign == 0) {
            u32(0);
            return;
        }
        std::size_t count = (mpz_sizeinbase(z.get_mpz_t(), 2) + 7) / 8;
        std::vector<unsigned char> bytes(count);
        mpz_export(bytes.data(), &count, 1, 1, 1, 0, z.get_mpz_t());
        u32(static_cast<std::uint32_t>(count));
        out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(count));
    }

    void polynomial(const IntPolynomial& p) {
        u32(static_cast<std::uint32_t>(p.coefficients().size()));
        for (const auto& c : p.coefficients()) integer(c);
    }

private:
    std::ostream& out_;
};

class BinaryReader {
public:
    BinaryReader(std::istream& in, std::uint64_t size, const std::string& source)
        : in_(in), remaining_(size), source_(source) {}

    /// Throws FormatError unless `count` items of at least `min_bytes` each can still follow.
    void require(std::uint64_t count, std::uint64_t min_bytes) const {
        if (min_bytes != 0 && count > remaining_ / min_bytes) {
            throw FormatError("length field " + std::to_string(count) +
                              " exceeds the remaining " + std::to_string(remaining_) + " bytes", source_);
        }
    }

    void bytes(char* dst, std::size_t n) {
        require(n, 1);
        in_.read(dst, static_cast<std::streamsize>(n));
        if (static_cast<std::size_t>(in_.gcount()) != n) {
            throw FormatError("truncated segment file", source_);
        }
        remaining_ -= n;
    }

    std::uint8_t u8() {
        char c;
        bytes(&c, 1);
        return static_cast<std::uint8_t>(c);
    }

    std::uint32_t u32() {
        unsigned char buf[4];
        bytes(reinterpret_cast<char*>(buf), 4);
        std::uint32_t v = 0;
        for (int i = 3; i >= 0; --i) v = (v << 8) | buf[i];
        return v;
    }

    std::int64_t i64() {
        unsigned char buf[8];
        bytes(reinterpret_cast<char*>(buf), 8);
        std::uint64_t v = 0;
        for (int i = 7; i >= 0; --i) v = (v << 8) | buf[i];
        return static_cast<std::int64_t>(v);
    }

    std::string string() {
        std::uint32_t n = u32();
        require(n, 1);
        std::string s(n, '\0');
        if (n) bytes(&s[0], n);
        return s;
    }

    mpz_class integer() {
        std::uint8_t sign = u8();
        std::uint32_t count = u32();
        if (sign > 2 || (sign == 0) != (count == 0)) {
            throw FormatError("malformed integer encoding", source_);
        }
        require(count, 1);
        mpz_class z;
        if (count) {
            std::vector<unsigned char> buf(count);
            bytes(reinterpret_cast<char*>(buf.data()), count);
            mpz_import(z.get_mpz_t(), count, 1, 1, 1, 0, buf.data());
        }
        if (sign == 2) z = -z;
        return z;
    }

    IntPolynomial polynomial() {
        std::uint32_t n = u32();
        require(n, MIN_INTEGER_BYTES);
        std::vector<mpz_class> coeffs;
        coeffs.reserve(n);
        for (std::uint32_t i = 0; i < n; ++i) coeffs.push_back(integer());
        return IntPolynomial(std::move(coeffs));
    }

private:
    std::istream& in_;
    std::uint64_t remaining_;
    std::string source_;
};

void write_header(BinaryWriter& w, const SegmentMetadata& meta) {
    for (char c : SEGMENT_MAGIC) w.u8(static_cast<std::uint8_t>(c));
    w.u32(SEGMENT_FORMAT_VERSION);
    w.u8(static_cast<std::uint8_t>(meta.kind));
    w.u8(meta.completion ? 1 : 0);
    w.i64(meta.start_n);
    w.i64(meta.length);
    w.i64(meta.completion ? meta.completion->p : 0);
    w.i64(meta.completion ? meta.completion->m : 0);
    w.u32(meta.precision);
    w.polynomial(meta.min_poly);
    w.string(meta.root);
}

SegmentMetadata read_header(BinaryReader& r, const fs::path& file) {
    char magic[sizeof(SEGMENT_MAGIC)];
    r.bytes(magic, sizeof(magic));
    if (std::memcmp(magic, SEGMENT_MAGIC, sizeof(magic)) != 0) {
        throw FormatError("not a segment file", file.string());
    }
    std::uint32_t version = r.u32();
    if (version != SEGMENT_FORMAT_VERSION) {
        throw FormatError("unsupported segment format version " + std::to_string(version) +
                          " (expected " + std::to_string(SEGMENT_FORMAT_VERSION) + ")", file.string());
    }

    SegmentMetadata meta;
    std::uint8_t kind = r.u8();
    if (kind != static_cast<std::uint8_t>(SequenceKind::Digit) &&
        kind != static_cast<std::uint8_t>(SequenceKind::Iterate)) {
        throw FormatError("unknown sequence kind " + std::to_string(kind), file.string());
    }
    meta.kind = static_cast<SequenceKind>(kind);
    bool complete = r.u8() != 0;
    meta.start_n = r.i64();
    meta.length = r.i64();
    Period period{r.i64(), 0};
    period.m = r.i64();
    if (complete) meta.completion = period;
    meta.precision = r.u32();
    meta.min_poly = r.polynomial();
    meta.root = r.string();
    meta.filename = file.filename().string();

    if (meta.start_n < 0 || meta.length <= 0) {
        throw FormatError("invalid segment range", file.string());
    }
    return meta;
}

template <class Seq>
void write_value(BinaryWriter& w, const typename Seq::value_type& v);

template <>
void write_value<DigitSequence>(BinaryWriter& w, const Digit& v) { w.i64(v); }

template <>
void write_value<IterateSequence>(BinaryWriter& w, const IntPolynomial& v) { w.polynomial(v); }

template <class Seq>
constexpr std::uint64_t min_value_bytes();

template <>
constexpr std::uint64_t min_value_bytes<DigitSequence>() { return DIGIT_BYTES; }

template <>
constexpr std::uint64_t min_value_bytes<IterateSequence>() { return MIN_POLYNOMIAL_BYTES; }

template <class Seq>
typename Seq::value_type read_value(BinaryReader& r);

template <>
Digit read_value<DigitSequence>(BinaryReader& r) { return r.i64(); }

template <>
IntPolynomial read_value<IterateSequence>(BinaryReader& r) { return r.polynomial(); }

std::uint64_t file_size_or_throw(const fs::path& file) {
    std::error_code ec;
    const std::uintmax_t size = fs::file_size(file, ec);
    if (ec) {
        throw IOError("cannot stat segment file: " + ec.message(), file.string());
    }
    return static_cast<std::uint64_t>(size);
}

/// Flushes a written file (or a directory entry) to stable storage.
void sync_path(const fs::path& path, int flags) {
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        throw IOError(std::string("cannot open for sync: ") + std::strerror(errno), path.string());
    }
    int rc = ::fsync(fd);
    int saved = errno;
    ::close(fd);
    if (rc != 0) {
        throw IOError(std::string("fsync failed: ") + std::strerror(saved), path.string());
    }
}

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

template <class Seq>
void write_segment_file(const fs::path& directory,
                        const SegmentMetadata& metadata,
                        const std::vector<typename Seq::value_type>& payload) {
    if (metadata.kind != Seq::kind) {
        throw InvalidArgumentError("metadata kind does not match payload kind", metadata.filename);
    }
    if (static_cast<Index>(payload.size()) != metadata.length) {
        throw InvalidArgumentError("payload size does not match metadata length", metadata.filename);
    }

    const fs::path final_path = directory / metadata.filename;
    const fs::path tmp_path = directory / (metadata.filename + ".tmp");
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw IOError("cannot open segment file for writing", tmp_path.string(),
                          "check that the register directory is writable");
        }
        BinaryWriter w(out);
        write_header(w, metadata);
        for (const auto& v : payload) write_value<Seq>(w, v);
        out.close();
        if (!out) {
            throw IOError("failed writing segment file", tmp_path.string());
        }
    }

    // Payload reaches the disk before the name does.
    sync_path(tmp_path, O_RDONLY);

    std::error_code ec;
    fs::rename(tmp_path, final_path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw IOError("cannot move segment file into place: " + ec.message(), final_path.string());
    }
    sync_path(directory.empty() ? fs::path(".") : directory, O_RDONLY | O_DIRECTORY);
}

SegmentMetadata read_segment_metadata(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("cannot open segment file", file.string());
    }
    BinaryReader r(in, file_size_or_throw(file), file.string());
    return read_header(r, file);
}

template <class Seq>
DiskSegment<Seq> read_segment_file(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("cannot open segment file", file.string());
    }
    BinaryReader r(in, file_size_or_throw(file), file.string());
    SegmentMetadata meta = read_header(r, file);
    if (meta.kind != Seq::kind) {
        throw FormatError(std::string("segment holds ") + to_string(meta.kind) +
                          ", expected " + to_string(Seq::kind), file.string());
    }

    r.require(static_cast<std::uint64_t>(meta.length), min_value_bytes<Seq>());
    std::vector<typename Seq::value_type> data;
    data.reserve(static_cast<std::size_t>(meta.length));
    for (Index i = 0; i < meta.length; ++i) {
        data.push_back(read_value<Seq>(r));
    }
    return DiskSegment<Seq>(std::move(meta), std::move(data));
}

std::string random_segment_filename(const fs::path& directory) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(FILENAME_ALPHABET) - 2);

    for (int attempt = 0; attempt < FILENAME_ATTEMPTS; ++attempt) {
        std::string name;
        name.reserve(FILENAME_LENGTH + 4);
        for (std::size_t i = 0; i < FILENAME_LENGTH; ++i) {
            name.push_back(FILENAME_ALPHABET[pick(rng)]);
        }
        name += SEGMENT_EXTENSION;
        std::error_code ec;
        if (!fs::exists(directory / name, ec) && !fs::exists(directory / (name + ".tmp"), ec)) {
            return name;
        }
    }
    throw IOError("no unused segment filename after " + std::to_string(FILENAME_ATTEMPTS) + " attempts",
                  directory.string());
}

template void write_segment_file<DigitSequence>(const fs::path&, const SegmentMetadata&,
                                                const std::vector<Digit>&);
template void write_segment_file<IterateSequence>(const fs::path&, const SegmentMetadata&,
                                                  const std::vector<IntPolynomial>&);
template DiskSegment<DigitSequence> read_segment_file<DigitSequence>(const fs::path&);
template DiskSegment<IterateSequence> read_segment_file<IterateSequence>(const fs::path&);

} // namespace betaorbit
