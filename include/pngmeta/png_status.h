#pragma once

#include <cstdint>
#include <string>

/**
 * \file png_status.h
 * \brief Result status shared by the PNG container codec, the chunk payload
 * codecs and the chunk list operations.
 */

namespace pngmeta {

/// Operation result status.
enum class PngStatus : uint8_t {
    Ok,
    /// The 8-byte PNG signature is missing or the buffer is shorter than it.
    InvalidHeader,
    /// A length, type, payload or CRC field runs past the end of the buffer.
    TruncatedData,
    /// The stored CRC does not match the CRC computed over type and payload.
    IntegrityError,
    /// The buffer ended before an `IEND` chunk was read.
    MissingTerminator,
    /// A chunk type tag contains a byte that is not an ASCII letter.
    InvalidChunkType,
    /// A keyword is empty or longer than 79 characters.
    InvalidKeyword,
    /// A text field contains a character its chunk type does not allow.
    InvalidCharset,
    /// An expected NUL separator is absent.
    MissingSeparator,
    /// A compression method byte other than 0 (deflate).
    UnsupportedMethod,
    /// A compressed payload is not a valid deflate stream.
    MalformedStream,
    /// A fixed-size payload has the wrong length.
    InvalidLength,
    /// A list operation was called with a chunk type it does not accept.
    InvalidOperation,
    /// Resource limits were exceeded.
    LimitExceeded,
};

static constexpr uint32_t kNoChunkIndex = 0xFFFFFFFFU;

/**
 * \brief Status plus the context needed to diagnose a failure.
 *
 * \ref chunk_type is the FourCC of the chunk being processed (0 if none),
 * \ref chunk_index its position in the chunk list (\ref kNoChunkIndex if the
 * chunk is not part of a list) and \ref offset the byte offset of the chunk
 * within the parsed buffer (0 when no buffer is involved).
 */
struct PngResult final {
    PngStatus status     = PngStatus::Ok;
    uint32_t chunk_type  = 0;
    uint32_t chunk_index = kNoChunkIndex;
    uint64_t offset      = 0;
};

/// Returns a stable snake_case name for \p status.
const char*
png_status_name(PngStatus status) noexcept;

/**
 * \brief Formats a one-line diagnostic for \p result.
 *
 * Example: `integrity_error [chunk=tEXt index=2 offset=45]`.
 */
std::string
format_result_message(const PngResult& result);

}  // namespace pngmeta
