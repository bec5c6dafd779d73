#include "pngmeta/console_format.h"

#include <cstdio>

namespace pngmeta {
namespace {

    // Length of the well-formed UTF-8 sequence starting at s[i] (2..4), or 0.
    static size_t utf8_sequence_length(std::string_view s, size_t i,
                                       size_t end) noexcept
    {
        const unsigned char b0 = static_cast<unsigned char>(s[i]);
        size_t len             = 0;
        if (b0 >= 0xC2U && b0 <= 0xDFU) {
            len = 2;
        } else if (b0 >= 0xE0U && b0 <= 0xEFU) {
            len = 3;
        } else if (b0 >= 0xF0U && b0 <= 0xF4U) {
            len = 4;
        } else {
            return 0;
        }
        if (i + len > end) {
            return 0;
        }
        for (size_t j = 1; j < len; ++j) {
            const unsigned char b = static_cast<unsigned char>(s[i + j]);
            if ((b & 0xC0U) != 0x80U) {
                return 0;
            }
        }
        // C1 controls (U+0080..U+009F) are escaped like C0 controls.
        if (b0 == 0xC2U
            && static_cast<unsigned char>(s[i + 1]) < 0xA0U) {
            return 0;
        }
        return len;
    }

    static void append_escaped_byte(unsigned char c, std::string* out)
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(c));
        out->append(buf);
    }

}  // namespace

bool
append_console_escaped(std::string_view text, uint32_t max_bytes,
                       std::string* out) noexcept
{
    bool escaped     = false;
    const size_t end = (max_bytes == 0U || text.size() < max_bytes)
                           ? text.size()
                           : static_cast<size_t>(max_bytes);

    out->reserve(out->size() + end);
    size_t i = 0;
    while (i < end) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '\\' || c == '"') {
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            i += 1;
            continue;
        }
        if (c == '\n' || c == '\r' || c == '\t') {
            out->push_back('\\');
            out->push_back(c == '\n' ? 'n' : (c == '\r' ? 'r' : 't'));
            escaped = true;
            i += 1;
            continue;
        }
        if (c >= 0x20U && c < 0x7FU) {
            out->push_back(static_cast<char>(c));
            i += 1;
            continue;
        }
        if (c >= 0x80U) {
            const size_t len = utf8_sequence_length(text, i, end);
            if (len != 0) {
                out->append(text.substr(i, len));
                i += len;
                continue;
            }
        }
        append_escaped_byte(c, out);
        escaped = true;
        i += 1;
    }
    if (end < text.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    const size_t n = (max_bytes == 0U || bytes.size() < max_bytes)
                         ? bytes.size()
                         : static_cast<size_t>(max_bytes);

    static constexpr char kHex[] = "0123456789ABCDEF";
    out->reserve(out->size() + n * 2U);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t v = static_cast<uint8_t>(bytes[i]);
        out->push_back(kHex[v >> 4]);
        out->push_back(kHex[v & 0x0FU]);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}

}  // namespace pngmeta
