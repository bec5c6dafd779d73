#pragma once

#include "pngmeta/chunk.h"
#include "pngmeta/deflate.h"
#include "pngmeta/png_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file text_chunk.h
 * \brief Payload codecs for the textual chunks (`tEXt`, `zTXt`, `iTXt`) and
 * the physical resolution chunk (`pHYs`).
 *
 * All strings exchanged with callers are UTF-8. `tEXt` and `zTXt` store
 * Latin-1 on the wire and are converted in both directions; `iTXt` stores
 * UTF-8 as is.
 */

namespace pngmeta {

static constexpr uint32_t kMaxKeywordSize = 79;
static constexpr uint32_t kPhysPayloadSize = 9;

/// Keyword and text of a `tEXt` or `zTXt` chunk.
struct TextRecord final {
    std::string keyword;
    std::string text;
};

/// All fields of an `iTXt` chunk.
struct ItxtRecord final {
    std::string keyword;
    std::string text;
    /// If true, the UTF-8 text is stored deflate-compressed.
    bool compressed = false;
    /// RFC 3066 language tag (ASCII), may be empty.
    std::string language_tag;
    /// Keyword translated to the language of \ref language_tag, may be empty.
    std::string translated_keyword;
};

/// `pHYs` unit specifier. Other byte values are preserved as is.
enum class PhysUnit : uint8_t {
    Unknown = 0,
    Meter   = 1,
};

/// `pHYs` pixel density.
struct PhysRecord final {
    uint32_t pixels_per_unit_x = 0;
    uint32_t pixels_per_unit_y = 0;
    PhysUnit unit              = PhysUnit::Unknown;
};

/// Compression settings for `zTXt` and compressed `iTXt` payloads.
struct TextCodecOptions final {
    DeflateOptions deflate;
    InflateOptions inflate;
};

/**
 * \brief Encodes a `tEXt` payload: `keyword NUL text`.
 *
 * The keyword must be 1..79 printable Latin-1 characters; the text may hold
 * printable Latin-1 characters and line feeds.
 */
PngResult
encode_text(const TextRecord& record, std::vector<std::byte>* out);

/// Decodes a `tEXt` payload. Only one NUL is permitted.
PngResult
decode_text(std::span<const std::byte> payload, TextRecord* out);

/// Encodes a `zTXt` payload: `keyword NUL method(0) deflate(text)`.
PngResult
encode_ztxt(const TextRecord& record, std::vector<std::byte>* out,
            const TextCodecOptions& options = TextCodecOptions {});

PngResult
decode_ztxt(std::span<const std::byte> payload, TextRecord* out,
            const TextCodecOptions& options = TextCodecOptions {});

/**
 * \brief Encodes an `iTXt` payload.
 *
 * Layout: `keyword NUL flag method(0) language NUL translated NUL text`,
 * where text is deflate-compressed when \ref ItxtRecord::compressed is set.
 */
PngResult
encode_itxt(const ItxtRecord& record, std::vector<std::byte>* out,
            const TextCodecOptions& options = TextCodecOptions {});

PngResult
decode_itxt(std::span<const std::byte> payload, ItxtRecord* out,
            const TextCodecOptions& options = TextCodecOptions {});

/// Encodes the 9-byte `pHYs` payload.
void
encode_phys(const PhysRecord& record, std::vector<std::byte>* out);

PngResult
decode_phys(std::span<const std::byte> payload, PhysRecord* out) noexcept;

/// Converts dots per inch to pixels per meter (rounded).
uint32_t
phys_from_dpi(uint32_t dpi) noexcept;

/// Converts a meter-based record to dots per inch. Returns false for other units.
bool
phys_dpi(const PhysRecord& record, uint32_t* dpi_x, uint32_t* dpi_y) noexcept;

/**
 * \brief Decodes keyword and text of any textual chunk.
 *
 * Fails with \ref PngStatus::InvalidOperation if \p chunk is not textual.
 */
PngResult
decode_text_chunk(const Chunk& chunk, TextRecord* out,
                  const TextCodecOptions& options = TextCodecOptions {});

/**
 * \brief Builds a textual chunk of \p kind (`Text`, `Ztxt` or `Itxt`).
 *
 * `Itxt` chunks are built uncompressed with empty language and translated
 * keyword fields.
 */
PngResult
make_text_chunk(ChunkKind kind, std::string_view keyword,
                std::string_view text, Chunk* out,
                const TextCodecOptions& options = TextCodecOptions {});

/// Builds a `pHYs` chunk.
Chunk
make_phys_chunk(const PhysRecord& record);

}  // namespace pngmeta
