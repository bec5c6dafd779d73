#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file chunk.h
 * \brief PNG chunk value type and chunk type classification.
 */

namespace pngmeta {

/// Packs four ASCII characters into a big-endian FourCC integer.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

static constexpr uint32_t kChunkIhdr = fourcc('I', 'H', 'D', 'R');
static constexpr uint32_t kChunkPlte = fourcc('P', 'L', 'T', 'E');
static constexpr uint32_t kChunkIdat = fourcc('I', 'D', 'A', 'T');
static constexpr uint32_t kChunkIend = fourcc('I', 'E', 'N', 'D');
static constexpr uint32_t kChunkText = fourcc('t', 'E', 'X', 't');
static constexpr uint32_t kChunkZtxt = fourcc('z', 'T', 'X', 't');
static constexpr uint32_t kChunkItxt = fourcc('i', 'T', 'X', 't');
static constexpr uint32_t kChunkPhys = fourcc('p', 'H', 'Y', 's');

/// Chunk types the library distinguishes. Everything else is \ref Unknown
/// and is carried through parse/serialize unchanged.
enum class ChunkKind : uint8_t {
    Unknown,
    Ihdr,
    Plte,
    Idat,
    Iend,
    Text,
    Ztxt,
    Itxt,
    Phys,
};

/// How many chunks of one type a list may hold.
enum class ChunkCardinality : uint8_t {
    /// At most one; updates replace the existing chunk in place.
    Single,
    /// Zero or more; new chunks are appended before `IEND`.
    Multiple,
};

/**
 * \brief One PNG chunk: a FourCC type and its opaque payload.
 *
 * Length and CRC are not stored; they are derived from \ref data when the
 * chunk is serialized.
 */
struct Chunk final {
    uint32_t type = 0;
    std::vector<std::byte> data;

    friend bool operator==(const Chunk&, const Chunk&) = default;
};

/// Ordered chunk sequence as it appears in the file (signature excluded).
using ChunkList = std::vector<Chunk>;

ChunkKind
chunk_kind(uint32_t type) noexcept;

ChunkCardinality
chunk_cardinality(ChunkKind kind) noexcept;

/// True for `tEXt`, `zTXt` and `iTXt`.
bool
is_text_chunk(uint32_t type) noexcept;

/// True if the first type letter is uppercase (ancillary bit clear).
bool
is_critical_chunk(uint32_t type) noexcept;

/// True if all four type bytes are ASCII letters.
bool
is_valid_chunk_type(uint32_t type) noexcept;

/// Returns the four type characters; non-printable bytes become '?'.
std::string
chunk_type_name(uint32_t type);

/// Parses a four-letter type name. Returns 0 if \p name is not a valid type.
uint32_t
chunk_type_from_name(std::string_view name) noexcept;

}  // namespace pngmeta
