#include "pngmeta/png_chunks.h"

#include "pngmeta/crc32.h"

#include <cstring>
#include <utility>

namespace pngmeta {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset > bytes.size() || bytes.size() - offset < 4) {
            return false;
        }
        const size_t o = static_cast<size_t>(offset);
        *out           = (static_cast<uint32_t>(u8(bytes[o + 0])) << 24)
               | (static_cast<uint32_t>(u8(bytes[o + 1])) << 16)
               | (static_cast<uint32_t>(u8(bytes[o + 2])) << 8)
               | (static_cast<uint32_t>(u8(bytes[o + 3])) << 0);
        return true;
    }


    static void append_u32be(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }


    static PngResult chunk_error(PngStatus status, uint32_t type,
                                 uint32_t index, uint64_t offset) noexcept
    {
        PngResult res;
        res.status      = status;
        res.chunk_type  = type;
        res.chunk_index = index;
        res.offset      = offset;
        return res;
    }

}  // namespace

bool
has_png_signature(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() < kPngSignatureSize) {
        return false;
    }
    return std::memcmp(bytes.data(), kPngSignature.data(), kPngSignatureSize)
           == 0;
}


PngResult
parse_png_chunks(std::span<const std::byte> bytes, ChunkList* out,
                 const ParseOptions& options)
{
    PngResult res;
    if (!has_png_signature(bytes)) {
        res.status = PngStatus::InvalidHeader;
        return res;
    }

    ChunkList chunks;
    uint64_t offset = kPngSignatureSize;
    for (;;) {
        const uint32_t index = static_cast<uint32_t>(chunks.size());
        if (offset >= bytes.size()) {
            return chunk_error(PngStatus::MissingTerminator, 0, kNoChunkIndex,
                               offset);
        }
        if (index >= options.limits.max_chunks) {
            return chunk_error(PngStatus::LimitExceeded, 0, index, offset);
        }

        const uint64_t chunk_off = offset;
        uint32_t len             = 0;
        uint32_t type            = 0;
        if (!read_u32be(bytes, offset, &len)
            || !read_u32be(bytes, offset + 4, &type)) {
            return chunk_error(PngStatus::TruncatedData, 0, index, chunk_off);
        }

        const uint64_t data_off = offset + 8;
        const uint64_t crc_off  = data_off + static_cast<uint64_t>(len);
        uint32_t stored_crc     = 0;
        if (!read_u32be(bytes, crc_off, &stored_crc)) {
            return chunk_error(PngStatus::TruncatedData, type, index,
                               chunk_off);
        }

        const std::span<const std::byte> data
            = bytes.subspan(static_cast<size_t>(data_off),
                            static_cast<size_t>(len));
        if (chunk_crc32(type, data) != stored_crc) {
            return chunk_error(PngStatus::IntegrityError, type, index,
                               chunk_off);
        }
        if (!is_valid_chunk_type(type)) {
            return chunk_error(PngStatus::InvalidChunkType, type, index,
                               chunk_off);
        }
        if (len > kMaxChunkDataSize) {
            return chunk_error(PngStatus::InvalidLength, type, index,
                               chunk_off);
        }
        if (len > options.limits.max_chunk_bytes) {
            return chunk_error(PngStatus::LimitExceeded, type, index,
                               chunk_off);
        }
        if (type == kChunkIend && len != 0U) {
            return chunk_error(PngStatus::InvalidLength, type, index,
                               chunk_off);
        }

        Chunk chunk;
        chunk.type = type;
        chunk.data.assign(data.begin(), data.end());
        chunks.push_back(std::move(chunk));

        offset = crc_off + 4;
        if (type == kChunkIend) {
            break;
        }
    }

    out->swap(chunks);
    return res;
}


uint64_t
serialized_size(std::span<const Chunk> chunks) noexcept
{
    uint64_t size = kPngSignatureSize;
    for (size_t i = 0; i < chunks.size(); ++i) {
        size += 12U + static_cast<uint64_t>(chunks[i].data.size());
    }
    return size;
}


PngResult
serialize_png_chunks(std::span<const Chunk> chunks,
                     std::vector<std::byte>* out)
{
    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& c = chunks[i];
        if (!is_valid_chunk_type(c.type)) {
            return chunk_error(PngStatus::InvalidChunkType, c.type,
                               static_cast<uint32_t>(i), 0);
        }
        if (c.data.size() > kMaxChunkDataSize) {
            return chunk_error(PngStatus::InvalidLength, c.type,
                               static_cast<uint32_t>(i), 0);
        }
    }

    std::vector<std::byte> bytes;
    bytes.reserve(static_cast<size_t>(serialized_size(chunks)));
    bytes.insert(bytes.end(), kPngSignature.begin(), kPngSignature.end());
    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& c = chunks[i];
        append_u32be(&bytes, static_cast<uint32_t>(c.data.size()));
        append_u32be(&bytes, c.type);
        bytes.insert(bytes.end(), c.data.begin(), c.data.end());
        append_u32be(&bytes, chunk_crc32(c.type, c.data));
    }

    out->swap(bytes);
    return PngResult {};
}

}  // namespace pngmeta
