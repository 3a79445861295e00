// =============================================================================
// Segment File Tests
// =============================================================================

#include <gtest/gtest.h>
#include "betaorbit/error.hpp"
#include "betaorbit/segment_file.hpp"
#include "orbit_fixtures.hpp"

#include <fstream>
#include <regex>
#include <set>

using namespace betaorbit;
using namespace betaorbit::testing_fixtures;

namespace {

void put_u32(std::ostream& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.put(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void put_i64(std::ostream& out, std::int64_t v) {
    std::uint64_t u = static_cast<std::uint64_t>(v);
    for (int i = 0; i < 8; ++i) out.put(static_cast<char>((u >> (8 * i)) & 0xFF));
}

// Header fields up to and including precision; the caller appends the rest.
void put_header_prefix(std::ostream& out, SequenceKind kind, std::int64_t length) {
    out.write(SEGMENT_MAGIC, sizeof(SEGMENT_MAGIC));
    put_u32(out, SEGMENT_FORMAT_VERSION);
    out.put(static_cast<char>(kind));
    out.put(0);
    put_i64(out, 0);
    put_i64(out, length);
    put_i64(out, 0);
    put_i64(out, 0);
    put_u32(out, 64);
}

constexpr std::streamoff LENGTH_OFFSET = 8 + 4 + 1 + 1 + 8;

} // namespace

class SegmentFileTest : public ::testing::Test {
protected:
    using fs_path = std::filesystem::path;

    void SetUp() override {
        beta_ = std::make_unique<AlgebraicNumber>(boyd_quartic().min_poly, 128);
    }

    fs_path write_iterates(const std::string& name, Index start_n, std::vector<IntPolynomial> payload,
                           std::optional<Period> completion = std::nullopt) {
        SegmentMetadata meta = make_metadata(SequenceKind::Iterate, *beta_, start_n,
                                             static_cast<Index>(payload.size()), completion);
        meta.filename = name;
        write_segment_file<IterateSequence>(dir_.path(), meta, payload);
        return dir_.path() / name;
    }

    TempDir dir_{"segfile"};
    std::unique_ptr<AlgebraicNumber> beta_;
};

TEST_F(SegmentFileTest, IterateSegmentKeepsHeaderAndPayload) {
    mpz_class big("-123456789012345678901234567890");
    std::vector<IntPolynomial> payload = {
        IntPolynomial{1},
        IntPolynomial{},
        IntPolynomial(std::vector<mpz_class>{big, 0, 7}),
    };
    auto file = write_iterates("a.seg", 40, payload, Period{7, 3});

    SegmentMetadata meta = read_segment_metadata(file);
    EXPECT_EQ(meta.kind, SequenceKind::Iterate);
    EXPECT_EQ(meta.min_poly, beta_->min_poly());
    EXPECT_EQ(meta.precision, 128u);
    EXPECT_EQ(meta.start_n, 40);
    EXPECT_EQ(meta.length, 3);
    ASSERT_TRUE(meta.completion.has_value());
    EXPECT_EQ(*meta.completion, (Period{7, 3}));
    EXPECT_EQ(meta.filename, "a.seg");
    EXPECT_EQ(meta.root.substr(0, 12), "2.0659948920");

    DiskSegment<IterateSequence> segment = read_segment_file<IterateSequence>(file);
    EXPECT_EQ(segment.data(), payload);
    EXPECT_EQ(segment.at(42).coefficient(0), big);
    EXPECT_THROW(segment.at(43), DataNotFoundError);
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "a.seg.tmp"));
}

TEST_F(SegmentFileTest, DigitSegmentWithoutCompletion) {
    SegmentMetadata meta = make_metadata(SequenceKind::Digit, *beta_, 0, 4);
    meta.filename = "d.seg";
    write_segment_file<DigitSequence>(dir_.path(), meta, {2, 0, 0, 1});

    auto segment = read_segment_file<DigitSequence>(dir_.path() / "d.seg");
    EXPECT_EQ(segment.data(), (std::vector<Digit>{2, 0, 0, 1}));
    EXPECT_FALSE(segment.metadata().completion.has_value());
}

TEST_F(SegmentFileTest, WrongKindIsRejected) {
    auto file = write_iterates("k.seg", 0, {IntPolynomial{1}});
    EXPECT_THROW(read_segment_file<DigitSequence>(file), FormatError);

    SegmentMetadata meta = make_metadata(SequenceKind::Digit, *beta_, 0, 1);
    meta.filename = "x.seg";
    EXPECT_THROW(write_segment_file<IterateSequence>(dir_.path(), meta, {IntPolynomial{1}}),
                 InvalidArgumentError);
    EXPECT_THROW(write_segment_file<DigitSequence>(dir_.path(), meta, {1, 2}), InvalidArgumentError);
}

TEST_F(SegmentFileTest, VersionMismatchIsFormatError) {
    auto file = write_iterates("v.seg", 0, {IntPolynomial{1}});
    {
        std::fstream f(file, std::ios::in | std::ios::out | std::ios::binary);
        f.seekp(8);
        f.put(static_cast<char>(SEGMENT_FORMAT_VERSION + 1));
    }
    try {
        read_segment_metadata(file);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FORMAT_MISMATCH);
    }
}

TEST_F(SegmentFileTest, ForeignAndTruncatedFilesAreFormatErrors) {
    auto foreign = dir_.path() / "foreign.seg";
    {
        std::ofstream out(foreign, std::ios::binary);
        out << "this is not a segment file at all";
    }
    EXPECT_THROW(read_segment_metadata(foreign), FormatError);

    auto file = write_iterates("t.seg", 0, {IntPolynomial{1, 2, 3}, IntPolynomial{4, 5}});
    std::filesystem::resize_file(file, std::filesystem::file_size(file) - 3);
    EXPECT_NO_THROW(read_segment_metadata(file));
    EXPECT_THROW(read_segment_file<IterateSequence>(file), FormatError);

    EXPECT_THROW(read_segment_metadata(dir_.path() / "missing.seg"), IOError);
}

TEST_F(SegmentFileTest, RandomFilenames) {
    const std::regex pattern("[2-9a-kmnp-zA-HJ-NP-Z]{20}\\.seg");
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        std::string name = random_segment_filename(dir_.path());
        EXPECT_TRUE(std::regex_match(name, pattern)) << name;
        seen.insert(name);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST_F(SegmentFileTest, OversizedCountsAreFormatErrors) {
    // Minimal polynomial claiming 2^32 - 1 coefficients
    auto poly_count = dir_.path() / "poly.seg";
    {
        std::ofstream out(poly_count, std::ios::binary);
        put_header_prefix(out, SequenceKind::Digit, 1);
        put_u32(out, 0xFFFFFFFFu);
    }
    EXPECT_THROW(read_segment_metadata(poly_count), FormatError);

    // One coefficient whose magnitude claims about 4 GiB
    auto int_count = dir_.path() / "int.seg";
    {
        std::ofstream out(int_count, std::ios::binary);
        put_header_prefix(out, SequenceKind::Digit, 1);
        put_u32(out, 1);
        out.put(1);
        put_u32(out, 0xFFFFFFF0u);
    }
    EXPECT_THROW(read_segment_metadata(int_count), FormatError);

    // Root string of 2^31 characters
    auto root_size = dir_.path() / "root.seg";
    {
        std::ofstream out(root_size, std::ios::binary);
        put_header_prefix(out, SequenceKind::Digit, 1);
        put_u32(out, 1);
        out.put(1);
        put_u32(out, 1);
        out.put(1);
        put_u32(out, 0x80000000u);
    }
    EXPECT_THROW(read_segment_metadata(root_size), FormatError);
}

TEST_F(SegmentFileTest, LengthBeyondFileSizeIsFormatError) {
    auto iterates = write_iterates("len.seg", 0, {IntPolynomial{1}, IntPolynomial{1, 1}});
    {
        std::fstream f(iterates, std::ios::in | std::ios::out | std::ios::binary);
        f.seekp(LENGTH_OFFSET);
        put_i64(f, std::int64_t{1} << 40);
    }
    SegmentMetadata meta = read_segment_metadata(iterates);
    EXPECT_EQ(meta.length, std::int64_t{1} << 40);
    EXPECT_THROW(read_segment_file<IterateSequence>(iterates), FormatError);

    SegmentMetadata digit_meta = make_metadata(SequenceKind::Digit, *beta_, 0, 3);
    digit_meta.filename = "dlen.seg";
    write_segment_file<DigitSequence>(dir_.path(), digit_meta, {1, 0, 1});
    auto digits = dir_.path() / "dlen.seg";
    {
        std::fstream f(digits, std::ios::in | std::ios::out | std::ios::binary);
        f.seekp(LENGTH_OFFSET);
        put_i64(f, 4);
    }
    EXPECT_THROW(read_segment_file<DigitSequence>(digits), FormatError);
}
