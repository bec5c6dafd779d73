#pragma once

#include "pngmeta/chunk.h"
#include "pngmeta/png_status.h"
#include "pngmeta/text_chunk.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>

/**
 * \file chunk_list.h
 * \brief Chunk list edits that keep PNG ordering and cardinality rules.
 *
 * All functions operate on a caller-owned \ref ChunkList and keep no state.
 * A failed call leaves the list unchanged.
 */

namespace pngmeta {

static constexpr size_t kChunkNotFound = static_cast<size_t>(-1);

/// Returns the index of the first chunk of \p type, or \ref kChunkNotFound.
size_t
find_chunk(std::span<const Chunk> chunks, uint32_t type) noexcept;

/// Removes every chunk of \p type and returns how many were removed.
size_t
remove_chunks(ChunkList* chunks, uint32_t type);

/**
 * \brief Replaces the existing chunk of a single-instance type in place, or
 * inserts it right after `IHDR` (at the front if there is no `IHDR`).
 *
 * Fails with \ref PngStatus::InvalidOperation for multi-instance types.
 */
PngResult
insert_or_replace_chunk(ChunkList* chunks, Chunk chunk);

/**
 * \brief Inserts a multi-instance chunk before `IEND` (appends if there is
 * no `IEND`).
 *
 * Fails with \ref PngStatus::InvalidOperation for single-instance types.
 */
PngResult
add_chunk(ChunkList* chunks, Chunk chunk);

/**
 * \brief Adds a textual chunk or replaces the textual chunk with the same
 * keyword.
 *
 * Keywords are compared across `tEXt`, `zTXt` and `iTXt`, so an existing
 * `tEXt` chunk is replaced by a new `iTXt` chunk with the same keyword. Only
 * the first match is replaced, at its index; later chunks with the same
 * keyword are kept. Without a match the chunk is added before `IEND`.
 *
 * Every textual chunk in the list is decoded; a malformed one fails the call
 * with its decode status and \ref PngResult::chunk_index set.
 */
PngResult
add_or_update_text_chunk(ChunkList* chunks, Chunk chunk,
                         const TextCodecOptions& options = TextCodecOptions {});

/**
 * \brief Applies \ref add_or_update_text_chunk for every keyword/text pair,
 * building chunks of \p kind (`Text`, `Ztxt` or `Itxt`).
 *
 * All or nothing: on failure the list is unchanged.
 */
PngResult
add_or_update_text_chunks(ChunkList* chunks,
                          const std::map<std::string, std::string>& entries,
                          ChunkKind kind = ChunkKind::Text,
                          const TextCodecOptions& options = TextCodecOptions {});

/**
 * \brief Decodes every textual chunk into keyword -> text.
 *
 * Later chunks overwrite earlier ones with the same keyword. \p out is
 * replaced on success and unchanged on failure.
 */
PngResult
read_text_map(std::span<const Chunk> chunks,
              std::map<std::string, std::string>* out,
              const TextCodecOptions& options = TextCodecOptions {});

}  // namespace pngmeta
