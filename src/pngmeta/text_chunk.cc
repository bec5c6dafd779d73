#include "pngmeta/text_chunk.h"

#include <utility>

namespace pngmeta {
namespace {

    static constexpr uint8_t kCompressionDeflate = 0;

    static uint8_t u8(std::byte b) noexcept { return static_cast<uint8_t>(b); }

    static PngResult fail(PngStatus status, uint32_t chunk_type) noexcept
    {
        PngResult res;
        res.status     = status;
        res.chunk_type = chunk_type;
        return res;
    }

    // Reads one code point at *io_pos. Rejects overlong forms, surrogates and
    // values above U+10FFFF.
    static bool next_utf8(std::span<const std::byte> bytes, size_t* io_pos,
                          uint32_t* out_cp) noexcept
    {
        size_t i         = *io_pos;
        const uint8_t b0 = u8(bytes[i]);
        uint32_t cp      = 0;
        size_t len       = 0;
        if (b0 <= 0x7FU) {
            cp  = b0;
            len = 1;
        } else if (b0 >= 0xC2U && b0 <= 0xDFU) {
            cp  = static_cast<uint32_t>(b0 & 0x1FU);
            len = 2;
        } else if (b0 >= 0xE0U && b0 <= 0xEFU) {
            cp  = static_cast<uint32_t>(b0 & 0x0FU);
            len = 3;
        } else if (b0 >= 0xF0U && b0 <= 0xF4U) {
            cp  = static_cast<uint32_t>(b0 & 0x07U);
            len = 4;
        } else {
            return false;
        }
        if (i + len > bytes.size()) {
            return false;
        }
        if (len > 1) {
            const uint8_t b1 = u8(bytes[i + 1]);
            if ((b0 == 0xE0U && b1 < 0xA0U) || (b0 == 0xEDU && b1 >= 0xA0U)
                || (b0 == 0xF0U && b1 < 0x90U)
                || (b0 == 0xF4U && b1 >= 0x90U)) {
                return false;
            }
        }
        for (size_t j = 1; j < len; ++j) {
            const uint8_t bj = u8(bytes[i + j]);
            if ((bj & 0xC0U) != 0x80U) {
                return false;
            }
            cp = (cp << 6U) | static_cast<uint32_t>(bj & 0x3FU);
        }
        *io_pos = i + len;
        *out_cp = cp;
        return true;
    }

    static std::span<const std::byte> as_bytes(std::string_view s) noexcept
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(s.data()), s.size());
    }

    static bool is_valid_utf8(std::span<const std::byte> bytes) noexcept
    {
        size_t i = 0;
        while (i < bytes.size()) {
            uint32_t cp = 0;
            if (!next_utf8(bytes, &i, &cp)) {
                return false;
            }
        }
        return true;
    }

    static bool contains_nul(std::span<const std::byte> bytes) noexcept
    {
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (u8(bytes[i]) == 0U) {
                return true;
            }
        }
        return false;
    }

    static bool utf8_to_latin1(std::string_view utf8,
                               std::vector<std::byte>* out)
    {
        const std::span<const std::byte> bytes = as_bytes(utf8);
        out->clear();
        out->reserve(bytes.size());
        size_t i = 0;
        while (i < bytes.size()) {
            uint32_t cp = 0;
            if (!next_utf8(bytes, &i, &cp) || cp > 0xFFU) {
                return false;
            }
            out->push_back(std::byte { static_cast<uint8_t>(cp) });
        }
        return true;
    }

    static std::string latin1_to_utf8(std::span<const std::byte> bytes)
    {
        std::string out;
        out.reserve(bytes.size());
        for (size_t i = 0; i < bytes.size(); ++i) {
            const uint8_t c = u8(bytes[i]);
            if (c < 0x80U) {
                out.push_back(static_cast<char>(c));
            } else {
                out.push_back(static_cast<char>(0xC0U | (c >> 6)));
                out.push_back(static_cast<char>(0x80U | (c & 0x3FU)));
            }
        }
        return out;
    }

    static std::string to_string(std::span<const std::byte> bytes)
    {
        return std::string(reinterpret_cast<const char*>(bytes.data()),
                           bytes.size());
    }

    static bool is_latin1_printable(uint8_t c) noexcept
    {
        return (c >= 0x20U && c <= 0x7EU) || c >= 0xA1U;
    }

    // Validates and converts keyword and text of a tEXt/zTXt record.
    static PngResult latin1_fields(const TextRecord& record,
                                   uint32_t chunk_type,
                                   std::vector<std::byte>* keyword,
                                   std::vector<std::byte>* text)
    {
        if (!utf8_to_latin1(record.keyword, keyword)) {
            return fail(PngStatus::InvalidCharset, chunk_type);
        }
        if (keyword->empty() || keyword->size() > kMaxKeywordSize) {
            return fail(PngStatus::InvalidKeyword, chunk_type);
        }
        for (size_t i = 0; i < keyword->size(); ++i) {
            if (!is_latin1_printable(u8((*keyword)[i]))) {
                return fail(PngStatus::InvalidCharset, chunk_type);
            }
        }

        if (!utf8_to_latin1(record.text, text)) {
            return fail(PngStatus::InvalidCharset, chunk_type);
        }
        for (size_t i = 0; i < text->size(); ++i) {
            const uint8_t c = u8((*text)[i]);
            if (c != 0x0AU && !is_latin1_printable(c)) {
                return fail(PngStatus::InvalidCharset, chunk_type);
            }
        }
        return PngResult {};
    }

    // Returns the index of the first NUL at or after `from`, or bytes.size().
    static size_t find_nul(std::span<const std::byte> bytes,
                           size_t from) noexcept
    {
        for (size_t i = from; i < bytes.size(); ++i) {
            if (u8(bytes[i]) == 0U) {
                return i;
            }
        }
        return bytes.size();
    }

    static void append(std::vector<std::byte>* out,
                       std::span<const std::byte> bytes)
    {
        out->insert(out->end(), bytes.begin(), bytes.end());
    }

    static PngResult with_type(PngResult res, uint32_t chunk_type) noexcept
    {
        res.chunk_type = chunk_type;
        return res;
    }

}  // namespace

PngResult
encode_text(const TextRecord& record, std::vector<std::byte>* out)
{
    std::vector<std::byte> keyword;
    std::vector<std::byte> text;
    const PngResult res = latin1_fields(record, kChunkText, &keyword, &text);
    if (res.status != PngStatus::Ok) {
        return res;
    }

    std::vector<std::byte> payload;
    payload.reserve(keyword.size() + 1 + text.size());
    append(&payload, keyword);
    payload.push_back(std::byte { 0x00 });
    append(&payload, text);
    out->swap(payload);
    return PngResult {};
}


PngResult
decode_text(std::span<const std::byte> payload, TextRecord* out)
{
    const size_t sep = find_nul(payload, 0);
    if (sep >= payload.size()) {
        return fail(PngStatus::MissingSeparator, kChunkText);
    }
    const std::span<const std::byte> text = payload.subspan(sep + 1);
    if (contains_nul(text)) {
        return fail(PngStatus::InvalidCharset, kChunkText);
    }

    out->keyword = latin1_to_utf8(payload.first(sep));
    out->text    = latin1_to_utf8(text);
    return PngResult {};
}


PngResult
encode_ztxt(const TextRecord& record, std::vector<std::byte>* out,
            const TextCodecOptions& options)
{
    std::vector<std::byte> keyword;
    std::vector<std::byte> text;
    PngResult res = latin1_fields(record, kChunkZtxt, &keyword, &text);
    if (res.status != PngStatus::Ok) {
        return res;
    }

    std::vector<std::byte> compressed;
    res = deflate_compress(text, &compressed, options.deflate);
    if (res.status != PngStatus::Ok) {
        return with_type(res, kChunkZtxt);
    }

    std::vector<std::byte> payload;
    payload.reserve(keyword.size() + 2 + compressed.size());
    append(&payload, keyword);
    payload.push_back(std::byte { 0x00 });
    payload.push_back(std::byte { kCompressionDeflate });
    append(&payload, compressed);
    out->swap(payload);
    return PngResult {};
}


PngResult
decode_ztxt(std::span<const std::byte> payload, TextRecord* out,
            const TextCodecOptions& options)
{
    const size_t sep = find_nul(payload, 0);
    if (sep >= payload.size()) {
        return fail(PngStatus::MissingSeparator, kChunkZtxt);
    }
    if (sep + 1 >= payload.size()) {
        return fail(PngStatus::TruncatedData, kChunkZtxt);
    }
    if (u8(payload[sep + 1]) != kCompressionDeflate) {
        return fail(PngStatus::UnsupportedMethod, kChunkZtxt);
    }

    std::vector<std::byte> text;
    const PngResult res = deflate_decompress(payload.subspan(sep + 2), &text,
                                             options.inflate);
    if (res.status != PngStatus::Ok) {
        return with_type(res, kChunkZtxt);
    }
    if (contains_nul(text)) {
        return fail(PngStatus::InvalidCharset, kChunkZtxt);
    }

    out->keyword = latin1_to_utf8(payload.first(sep));
    out->text    = latin1_to_utf8(text);
    return PngResult {};
}


PngResult
encode_itxt(const ItxtRecord& record, std::vector<std::byte>* out,
            const TextCodecOptions& options)
{
    const std::span<const std::byte> keyword = as_bytes(record.keyword);
    if (keyword.empty() || keyword.size() > kMaxKeywordSize) {
        return fail(PngStatus::InvalidKeyword, kChunkItxt);
    }
    if (contains_nul(keyword) || !is_valid_utf8(keyword)) {
        return fail(PngStatus::InvalidCharset, kChunkItxt);
    }

    const std::span<const std::byte> language = as_bytes(record.language_tag);
    for (size_t i = 0; i < language.size(); ++i) {
        const uint8_t c = u8(language[i]);
        if (c < 0x20U || c > 0x7EU) {
            return fail(PngStatus::InvalidCharset, kChunkItxt);
        }
    }

    const std::span<const std::byte> translated = as_bytes(
        record.translated_keyword);
    if (contains_nul(translated) || !is_valid_utf8(translated)) {
        return fail(PngStatus::InvalidCharset, kChunkItxt);
    }

    const std::span<const std::byte> text = as_bytes(record.text);
    if (!is_valid_utf8(text)) {
        return fail(PngStatus::InvalidCharset, kChunkItxt);
    }

    std::vector<std::byte> compressed;
    if (record.compressed) {
        const PngResult res = deflate_compress(text, &compressed,
                                               options.deflate);
        if (res.status != PngStatus::Ok) {
            return with_type(res, kChunkItxt);
        }
    }
    const std::span<const std::byte> body
        = record.compressed ? std::span<const std::byte>(compressed) : text;

    std::vector<std::byte> payload;
    payload.reserve(keyword.size() + language.size() + translated.size()
                    + body.size() + 5);
    append(&payload, keyword);
    payload.push_back(std::byte { 0x00 });
    payload.push_back(std::byte { static_cast<uint8_t>(record.compressed ? 1
                                                                         : 0) });
    payload.push_back(std::byte { kCompressionDeflate });
    append(&payload, language);
    payload.push_back(std::byte { 0x00 });
    append(&payload, translated);
    payload.push_back(std::byte { 0x00 });
    append(&payload, body);
    out->swap(payload);
    return PngResult {};
}


PngResult
decode_itxt(std::span<const std::byte> payload, ItxtRecord* out,
            const TextCodecOptions& options)
{
    // keyword\0 + comp_flag + comp_method + lang\0 + trans\0 + text
    const size_t keyword_end = find_nul(payload, 0);
    if (keyword_end >= payload.size()) {
        return fail(PngStatus::MissingSeparator, kChunkItxt);
    }
    if (keyword_end + 3 > payload.size()) {
        return fail(PngStatus::TruncatedData, kChunkItxt);
    }
    const uint8_t comp_flag   = u8(payload[keyword_end + 1]);
    const uint8_t comp_method = u8(payload[keyword_end + 2]);
    if (comp_method != kCompressionDeflate) {
        return fail(PngStatus::UnsupportedMethod, kChunkItxt);
    }

    const size_t lang_off = keyword_end + 3;
    const size_t lang_end = find_nul(payload, lang_off);
    if (lang_end >= payload.size()) {
        return fail(PngStatus::MissingSeparator, kChunkItxt);
    }
    const size_t trans_off = lang_end + 1;
    const size_t trans_end = find_nul(payload, trans_off);
    if (trans_end >= payload.size()) {
        return fail(PngStatus::MissingSeparator, kChunkItxt);
    }

    const std::span<const std::byte> keyword = payload.first(keyword_end);
    const std::span<const std::byte> language
        = payload.subspan(lang_off, lang_end - lang_off);
    const std::span<const std::byte> translated
        = payload.subspan(trans_off, trans_end - trans_off);
    const std::span<const std::byte> body = payload.subspan(trans_end + 1);

    std::vector<std::byte> text;
    if (comp_flag != 0U) {
        const PngResult res = deflate_decompress(body, &text,
                                                 options.inflate);
        if (res.status != PngStatus::Ok) {
            return with_type(res, kChunkItxt);
        }
    } else {
        text.assign(body.begin(), body.end());
    }

    if (!is_valid_utf8(keyword) || !is_valid_utf8(translated)
        || !is_valid_utf8(text)) {
        return fail(PngStatus::InvalidCharset, kChunkItxt);
    }
    for (size_t i = 0; i < language.size(); ++i) {
        if (u8(language[i]) >= 0x80U) {
            return fail(PngStatus::InvalidCharset, kChunkItxt);
        }
    }

    out->keyword            = to_string(keyword);
    out->compressed         = comp_flag != 0U;
    out->language_tag       = to_string(language);
    out->translated_keyword = to_string(translated);
    out->text               = to_string(text);
    return PngResult {};
}


void
encode_phys(const PhysRecord& record, std::vector<std::byte>* out)
{
    out->assign(kPhysPayloadSize, std::byte { 0x00 });
    const uint32_t x = record.pixels_per_unit_x;
    const uint32_t y = record.pixels_per_unit_y;
    for (uint32_t i = 0; i < 4; ++i) {
        const uint32_t shift = 24U - 8U * i;
        (*out)[i]     = std::byte { static_cast<uint8_t>((x >> shift) & 0xFF) };
        (*out)[4 + i] = std::byte { static_cast<uint8_t>((y >> shift) & 0xFF) };
    }
    (*out)[8] = std::byte { static_cast<uint8_t>(record.unit) };
}


PngResult
decode_phys(std::span<const std::byte> payload, PhysRecord* out) noexcept
{
    if (payload.size() != kPhysPayloadSize) {
        return fail(PngStatus::InvalidLength, kChunkPhys);
    }
    uint32_t x = 0;
    uint32_t y = 0;
    for (uint32_t i = 0; i < 4; ++i) {
        x = (x << 8) | u8(payload[i]);
        y = (y << 8) | u8(payload[4 + i]);
    }
    out->pixels_per_unit_x = x;
    out->pixels_per_unit_y = y;
    out->unit              = static_cast<PhysUnit>(u8(payload[8]));
    return PngResult {};
}


uint32_t
phys_from_dpi(uint32_t dpi) noexcept
{
    // 1 inch = 0.0254 m.
    const uint64_t ppm = (static_cast<uint64_t>(dpi) * 10000U + 127U) / 254U;
    return (ppm > 0xFFFFFFFFULL) ? 0xFFFFFFFFU : static_cast<uint32_t>(ppm);
}


bool
phys_dpi(const PhysRecord& record, uint32_t* dpi_x, uint32_t* dpi_y) noexcept
{
    if (record.unit != PhysUnit::Meter) {
        return false;
    }
    if (dpi_x) {
        *dpi_x = static_cast<uint32_t>(
            (static_cast<uint64_t>(record.pixels_per_unit_x) * 254U + 5000U)
            / 10000U);
    }
    if (dpi_y) {
        *dpi_y = static_cast<uint32_t>(
            (static_cast<uint64_t>(record.pixels_per_unit_y) * 254U + 5000U)
            / 10000U);
    }
    return true;
}


PngResult
decode_text_chunk(const Chunk& chunk, TextRecord* out,
                  const TextCodecOptions& options)
{
    switch (chunk_kind(chunk.type)) {
    case ChunkKind::Text: return decode_text(chunk.data, out);
    case ChunkKind::Ztxt: return decode_ztxt(chunk.data, out, options);
    case ChunkKind::Itxt: {
        ItxtRecord itxt;
        const PngResult res = decode_itxt(chunk.data, &itxt, options);
        if (res.status != PngStatus::Ok) {
            return res;
        }
        out->keyword = std::move(itxt.keyword);
        out->text    = std::move(itxt.text);
        return res;
    }
    default: return fail(PngStatus::InvalidOperation, chunk.type);
    }
}


PngResult
make_text_chunk(ChunkKind kind, std::string_view keyword,
                std::string_view text, Chunk* out,
                const TextCodecOptions& options)
{
    Chunk chunk;
    PngResult res;
    switch (kind) {
    case ChunkKind::Text: {
        chunk.type = kChunkText;
        res = encode_text(TextRecord { std::string(keyword), std::string(text) },
                          &chunk.data);
        break;
    }
    case ChunkKind::Ztxt: {
        chunk.type = kChunkZtxt;
        res = encode_ztxt(TextRecord { std::string(keyword), std::string(text) },
                          &chunk.data, options);
        break;
    }
    case ChunkKind::Itxt: {
        chunk.type = kChunkItxt;
        ItxtRecord record;
        record.keyword = std::string(keyword);
        record.text    = std::string(text);
        res            = encode_itxt(record, &chunk.data, options);
        break;
    }
    default: return fail(PngStatus::InvalidOperation, 0);
    }
    if (res.status != PngStatus::Ok) {
        return res;
    }
    *out = std::move(chunk);
    return res;
}


Chunk
make_phys_chunk(const PhysRecord& record)
{
    Chunk chunk;
    chunk.type = kChunkPhys;
    encode_phys(record, &chunk.data);
    return chunk;
}

}  // namespace pngmeta
