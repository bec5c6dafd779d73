#include "pngmeta/crc32.h"

#include <array>

#include <zlib.h>

namespace pngmeta {

uint32_t
update_crc32(uint32_t crc, std::span<const std::byte> bytes) noexcept
{
    // zlib takes uInt lengths; feed larger buffers in pieces.
    static constexpr size_t kMaxPiece = 0x40000000U;

    uLong c = static_cast<uLong>(crc);
    size_t off = 0;
    while (off < bytes.size()) {
        const size_t remaining = bytes.size() - off;
        const size_t n         = (remaining < kMaxPiece) ? remaining
                                                         : kMaxPiece;
        c = ::crc32(c, reinterpret_cast<const Bytef*>(bytes.data() + off),
                    static_cast<uInt>(n));
        off += n;
    }
    return static_cast<uint32_t>(c);
}


uint32_t
compute_crc32(std::span<const std::byte> bytes) noexcept
{
    return update_crc32(0U, bytes);
}


uint32_t
chunk_crc32(uint32_t type, std::span<const std::byte> data) noexcept
{
    const std::array<std::byte, 4> tag = {
        std::byte { static_cast<uint8_t>((type >> 24) & 0xFF) },
        std::byte { static_cast<uint8_t>((type >> 16) & 0xFF) },
        std::byte { static_cast<uint8_t>((type >> 8) & 0xFF) },
        std::byte { static_cast<uint8_t>((type >> 0) & 0xFF) },
    };
    return update_crc32(update_crc32(0U, tag), data);
}

}  // namespace pngmeta
