#include "pngmeta/chunk.h"

namespace pngmeta {
namespace {

    static constexpr uint8_t type_byte(uint32_t type, uint32_t i) noexcept
    {
        return static_cast<uint8_t>((type >> (24U - 8U * i)) & 0xFFU);
    }

    static constexpr bool is_ascii_letter(uint8_t c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

}  // namespace

ChunkKind
chunk_kind(uint32_t type) noexcept
{
    switch (type) {
    case kChunkIhdr: return ChunkKind::Ihdr;
    case kChunkPlte: return ChunkKind::Plte;
    case kChunkIdat: return ChunkKind::Idat;
    case kChunkIend: return ChunkKind::Iend;
    case kChunkText: return ChunkKind::Text;
    case kChunkZtxt: return ChunkKind::Ztxt;
    case kChunkItxt: return ChunkKind::Itxt;
    case kChunkPhys: return ChunkKind::Phys;
    default: return ChunkKind::Unknown;
    }
}


ChunkCardinality
chunk_cardinality(ChunkKind kind) noexcept
{
    switch (kind) {
    case ChunkKind::Idat:
    case ChunkKind::Text:
    case ChunkKind::Ztxt:
    case ChunkKind::Itxt: return ChunkCardinality::Multiple;
    case ChunkKind::Unknown:
    case ChunkKind::Ihdr:
    case ChunkKind::Plte:
    case ChunkKind::Iend:
    case ChunkKind::Phys: return ChunkCardinality::Single;
    }
    return ChunkCardinality::Single;
}


bool
is_text_chunk(uint32_t type) noexcept
{
    return type == kChunkText || type == kChunkZtxt || type == kChunkItxt;
}


bool
is_critical_chunk(uint32_t type) noexcept
{
    // Bit 5 of the first byte is the ancillary bit (lowercase letter).
    return (type_byte(type, 0) & 0x20U) == 0U;
}


bool
is_valid_chunk_type(uint32_t type) noexcept
{
    for (uint32_t i = 0; i < 4; ++i) {
        if (!is_ascii_letter(type_byte(type, i))) {
            return false;
        }
    }
    return true;
}


std::string
chunk_type_name(uint32_t type)
{
    std::string out(4, '?');
    for (uint32_t i = 0; i < 4; ++i) {
        const uint8_t c = type_byte(type, i);
        if (c >= 0x20U && c < 0x7FU) {
            out[i] = static_cast<char>(c);
        }
    }
    return out;
}


uint32_t
chunk_type_from_name(std::string_view name) noexcept
{
    if (name.size() != 4) {
        return 0;
    }
    const uint32_t type = fourcc(name[0], name[1], name[2], name[3]);
    return is_valid_chunk_type(type) ? type : 0U;
}

}  // namespace pngmeta
