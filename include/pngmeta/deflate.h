#pragma once

#include "pngmeta/png_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file deflate.h
 * \brief Deflate compression for compressed text payloads (zlib backed).
 */

namespace pngmeta {

/// Stream framing around the deflate data.
enum class DeflateFormat : uint8_t {
    /// Bare RFC 1951 stream, no header or checksum.
    Raw,
    /// RFC 1950 zlib stream (2-byte header, Adler-32 trailer).
    Zlib,
};

struct DeflateOptions final {
    /// zlib compression level, -1 (default) or 0..9.
    int level            = -1;
    DeflateFormat format = DeflateFormat::Raw;
};

/// Resource limits applied during decompression to bound hostile inputs.
struct InflateLimits final {
    uint64_t max_output_bytes = 64ULL * 1024ULL * 1024ULL;
};

struct InflateOptions final {
    DeflateFormat format = DeflateFormat::Raw;
    InflateLimits limits;
};

/**
 * \brief Compresses \p in into \p out (replacing its contents).
 *
 * Fails with \ref PngStatus::InvalidOperation for an out-of-range level.
 */
PngResult
deflate_compress(std::span<const std::byte> in, std::vector<std::byte>* out,
                 const DeflateOptions& options = DeflateOptions {});

/**
 * \brief Decompresses \p in into \p out (replacing its contents).
 *
 * Fails with \ref PngStatus::MalformedStream if \p in is not a complete
 * stream in the configured format, and with \ref PngStatus::LimitExceeded
 * if the output would exceed \ref InflateLimits::max_output_bytes. Bytes
 * after the end of the stream are ignored. \p out is unchanged on failure.
 */
PngResult
deflate_decompress(std::span<const std::byte> in, std::vector<std::byte>* out,
                   const InflateOptions& options = InflateOptions {});

}  // namespace pngmeta
