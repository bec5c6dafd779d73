#include "pngmeta/chunk_list.h"

#include <algorithm>
#include <utility>

namespace pngmeta {
namespace {

    static PngResult fail(PngStatus status, uint32_t chunk_type) noexcept
    {
        PngResult res;
        res.status     = status;
        res.chunk_type = chunk_type;
        return res;
    }

    static bool is_multi_instance(uint32_t type) noexcept
    {
        return chunk_cardinality(chunk_kind(type))
               == ChunkCardinality::Multiple;
    }

    static void insert_before_iend(ChunkList* chunks, Chunk chunk)
    {
        const size_t iend = find_chunk(*chunks, kChunkIend);
        if (iend == kChunkNotFound) {
            chunks->push_back(std::move(chunk));
            return;
        }
        chunks->insert(chunks->begin() + static_cast<std::ptrdiff_t>(iend),
                       std::move(chunk));
    }

}  // namespace

size_t
find_chunk(std::span<const Chunk> chunks, uint32_t type) noexcept
{
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].type == type) {
            return i;
        }
    }
    return kChunkNotFound;
}


size_t
remove_chunks(ChunkList* chunks, uint32_t type)
{
    const size_t before = chunks->size();
    chunks->erase(std::remove_if(chunks->begin(), chunks->end(),
                                 [type](const Chunk& c) {
                                     return c.type == type;
                                 }),
                  chunks->end());
    return before - chunks->size();
}


PngResult
insert_or_replace_chunk(ChunkList* chunks, Chunk chunk)
{
    if (is_multi_instance(chunk.type)) {
        return fail(PngStatus::InvalidOperation, chunk.type);
    }

    const size_t existing = find_chunk(*chunks, chunk.type);
    if (existing != kChunkNotFound) {
        (*chunks)[existing] = std::move(chunk);
        return PngResult {};
    }

    const size_t ihdr = find_chunk(*chunks, kChunkIhdr);
    const size_t pos  = (ihdr == kChunkNotFound) ? 0 : ihdr + 1;
    chunks->insert(chunks->begin() + static_cast<std::ptrdiff_t>(pos),
                   std::move(chunk));
    return PngResult {};
}


PngResult
add_chunk(ChunkList* chunks, Chunk chunk)
{
    if (!is_multi_instance(chunk.type)) {
        return fail(PngStatus::InvalidOperation, chunk.type);
    }
    insert_before_iend(chunks, std::move(chunk));
    return PngResult {};
}


PngResult
add_or_update_text_chunk(ChunkList* chunks, Chunk chunk,
                         const TextCodecOptions& options)
{
    if (!is_text_chunk(chunk.type)) {
        return fail(PngStatus::InvalidOperation, chunk.type);
    }

    TextRecord incoming;
    PngResult res = decode_text_chunk(chunk, &incoming, options);
    if (res.status != PngStatus::Ok) {
        return res;
    }

    // Decode every textual chunk before touching the list.
    size_t match = kChunkNotFound;
    for (size_t i = 0; i < chunks->size(); ++i) {
        const Chunk& c = (*chunks)[i];
        if (!is_text_chunk(c.type)) {
            continue;
        }
        TextRecord existing;
        res = decode_text_chunk(c, &existing, options);
        if (res.status != PngStatus::Ok) {
            res.chunk_index = static_cast<uint32_t>(i);
            return res;
        }
        if (match == kChunkNotFound && existing.keyword == incoming.keyword) {
            match = i;
        }
    }

    if (match == kChunkNotFound) {
        insert_before_iend(chunks, std::move(chunk));
        return PngResult {};
    }
    (*chunks)[match] = std::move(chunk);
    return PngResult {};
}


PngResult
add_or_update_text_chunks(ChunkList* chunks,
                          const std::map<std::string, std::string>& entries,
                          ChunkKind kind, const TextCodecOptions& options)
{
    if (kind != ChunkKind::Text && kind != ChunkKind::Ztxt
        && kind != ChunkKind::Itxt) {
        return fail(PngStatus::InvalidOperation, 0);
    }

    ChunkList edited = *chunks;
    for (const auto& [keyword, text] : entries) {
        Chunk chunk;
        PngResult res = make_text_chunk(kind, keyword, text, &chunk, options);
        if (res.status != PngStatus::Ok) {
            return res;
        }
        res = add_or_update_text_chunk(&edited, std::move(chunk), options);
        if (res.status != PngStatus::Ok) {
            return res;
        }
    }
    chunks->swap(edited);
    return PngResult {};
}


PngResult
read_text_map(std::span<const Chunk> chunks,
              std::map<std::string, std::string>* out,
              const TextCodecOptions& options)
{
    std::map<std::string, std::string> map;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (!is_text_chunk(chunks[i].type)) {
            continue;
        }
        TextRecord record;
        PngResult res = decode_text_chunk(chunks[i], &record, options);
        if (res.status != PngStatus::Ok) {
            res.chunk_index = static_cast<uint32_t>(i);
            return res;
        }
        map[std::move(record.keyword)] = std::move(record.text);
    }
    out->swap(map);
    return PngResult {};
}

}  // namespace pngmeta
