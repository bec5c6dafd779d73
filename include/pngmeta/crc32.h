#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file crc32.h
 * \brief CRC-32 (ISO 3309 / ITU-T V.42) as used by PNG chunks.
 */

namespace pngmeta {

/// Returns the CRC-32 of \p bytes.
uint32_t
compute_crc32(std::span<const std::byte> bytes) noexcept;

/// Continues a running CRC-32 with \p bytes. Start with 0.
uint32_t
update_crc32(uint32_t crc, std::span<const std::byte> bytes) noexcept;

/// CRC-32 over the big-endian type tag followed by \p data.
uint32_t
chunk_crc32(uint32_t type, std::span<const std::byte> data) noexcept;

}  // namespace pngmeta
