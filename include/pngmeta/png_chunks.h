#pragma once

#include "pngmeta/chunk.h"
#include "pngmeta/png_status.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file png_chunks.h
 * \brief PNG container codec: byte buffer <-> ordered chunk list.
 */

namespace pngmeta {

static constexpr uint32_t kPngSignatureSize = 8;
static constexpr std::array<std::byte, kPngSignatureSize> kPngSignature = {
    std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
    std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
    std::byte { 0x1A }, std::byte { 0x0A },
};

/// Largest payload length the PNG format allows.
static constexpr uint32_t kMaxChunkDataSize = 0x7FFFFFFFU;

/// Resource limits applied while parsing to bound hostile inputs.
struct ParseLimits final {
    uint32_t max_chunks      = 1U << 20;
    uint32_t max_chunk_bytes = kMaxChunkDataSize;
};

/// Options for \ref parse_png_chunks.
struct ParseOptions final {
    ParseLimits limits;
};

/// True if \p bytes starts with the PNG signature.
bool
has_png_signature(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Parses a PNG file into its chunk list.
 *
 * Every chunk's CRC is verified. Parsing stops after the `IEND` chunk;
 * anything after it is ignored. A buffer that ends without `IEND` fails with
 * \ref PngStatus::MissingTerminator. On failure \p out is left unchanged.
 */
PngResult
parse_png_chunks(std::span<const std::byte> bytes, ChunkList* out,
                 const ParseOptions& options = ParseOptions {});

/// Returns `8 + sum(12 + payload size)` for \p chunks.
uint64_t
serialized_size(std::span<const Chunk> chunks) noexcept;

/**
 * \brief Writes the signature and every chunk with a freshly computed CRC.
 *
 * Fails with \ref PngStatus::InvalidChunkType or \ref PngStatus::InvalidLength
 * if a chunk cannot be represented. On failure \p out is left unchanged.
 */
PngResult
serialize_png_chunks(std::span<const Chunk> chunks,
                     std::vector<std::byte>* out);

}  // namespace pngmeta
