#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "betaorbit/segment.hpp"

namespace betaorbit {

/**
 * Segment file layout, all integers little-endian:
 *
 *   magic       8 bytes  "BORBSEG\0"
 *   version     u32
 *   kind        u8       SequenceKind
 *   complete    u8       0 or 1
 *   start_n     i64
 *   length      i64
 *   p, m        i64, i64 (zero unless complete)
 *   precision   u32
 *   min_poly    u32 count, then count integers
 *   root        u32 size, then characters
 *   payload     `length` entries: i64 digits, or polynomials encoded
 *               like min_poly
 *
 * Integers are a sign byte (0 zero, 1 positive, 2 negative), a u32 byte
 * count and the big-endian magnitude.
 */
constexpr char SEGMENT_MAGIC[8] = {'B', 'O', 'R', 'B', 'S', 'E', 'G', '\0'};
constexpr std::uint32_t SEGMENT_FORMAT_VERSION = 1;
constexpr const char* SEGMENT_EXTENSION = ".seg";

/**
 * Writes metadata and payload to `directory / metadata.filename` through
 * a temporary file that is fsynced and renamed into place, so readers
 * never see a partial segment. Throws IOError.
 */
template <class Seq>
void write_segment_file(const std::filesystem::path& directory,
                        const SegmentMetadata& metadata,
                        const std::vector<typename Seq::value_type>& payload);

/// Reads the header only. Throws FormatError or IOError.
SegmentMetadata read_segment_metadata(const std::filesystem::path& file);

/// Reads header and payload. Throws FormatError or IOError.
template <class Seq>
DiskSegment<Seq> read_segment_file(const std::filesystem::path& file);

/**
 * Random file name of 20 symbols from a 56-letter alphabet that does not
 * yet exist in `directory`. Gives up after 10 collisions with IOError.
 */
std::string random_segment_filename(const std::filesystem::path& directory);

} // namespace betaorbit
