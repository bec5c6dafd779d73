#include "pngmeta/png_chunks.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

#include <zlib.h>

namespace pngmeta {
namespace {

    static void append_u32be(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }

    static void append_bytes(std::vector<std::byte>* out, std::string_view s)
    {
        for (char c : s) {
            out->push_back(std::byte { static_cast<uint8_t>(c) });
        }
    }

    // Appends one chunk record; the CRC is computed with zlib directly.
    static void append_png_chunk(std::vector<std::byte>* out,
                                 std::string_view type, std::string_view data)
    {
        append_u32be(out, static_cast<uint32_t>(data.size()));
        const size_t type_off = out->size();
        append_bytes(out, type);
        append_bytes(out, data);
        const uLong crc = crc32(
            0L, reinterpret_cast<const Bytef*>(out->data() + type_off),
            static_cast<uInt>(out->size() - type_off));
        append_u32be(out, static_cast<uint32_t>(crc));
    }

    static std::vector<std::byte> png_signature()
    {
        return std::vector<std::byte>(kPngSignature.begin(),
                                      kPngSignature.end());
    }

    static constexpr std::string_view kIhdr
        = std::string_view("\0\0\0\x01\0\0\0\x01\x08\x06\0\0\0", 13);

    // IHDR, tEXt, IDAT, IEND.
    static std::vector<std::byte> make_minimal_png()
    {
        std::vector<std::byte> png = png_signature();
        append_png_chunk(&png, "IHDR", kIhdr);
        append_png_chunk(&png, "tEXt", std::string_view("Author\0John Doe", 15));
        append_png_chunk(&png, "IDAT", "\x78\x9C\x62");
        append_png_chunk(&png, "IEND", {});
        return png;
    }

}  // namespace

TEST(PngChunks, ParsesChunksInOrder)
{
    const std::vector<std::byte> png = make_minimal_png();
    ASSERT_TRUE(has_png_signature(png));

    ChunkList chunks;
    const PngResult res = parse_png_chunks(png, &chunks);
    ASSERT_EQ(res.status, PngStatus::Ok);
    ASSERT_EQ(chunks.size(), 4U);
    EXPECT_EQ(chunks[0].type, kChunkIhdr);
    EXPECT_EQ(chunks[0].data.size(), 13U);
    EXPECT_EQ(chunks[1].type, kChunkText);
    EXPECT_EQ(chunks[1].data.size(), 15U);
    EXPECT_EQ(chunks[2].type, kChunkIdat);
    EXPECT_EQ(chunks[3].type, kChunkIend);
    EXPECT_TRUE(chunks[3].data.empty());
}


TEST(PngChunks, SerializeReproducesInput)
{
    const std::vector<std::byte> png = make_minimal_png();
    ChunkList chunks;
    ASSERT_EQ(parse_png_chunks(png, &chunks).status, PngStatus::Ok);
    EXPECT_EQ(serialized_size(chunks), png.size());

    std::vector<std::byte> again;
    ASSERT_EQ(serialize_png_chunks(chunks, &again).status, PngStatus::Ok);
    EXPECT_EQ(again, png);

    ChunkList reparsed;
    ASSERT_EQ(parse_png_chunks(again, &reparsed).status, PngStatus::Ok);
    EXPECT_EQ(reparsed, chunks);
}


TEST(PngChunks, RejectsBadSignature)
{
    const std::vector<std::byte> tiny = { std::byte { 0 }, std::byte { 1 },
                                          std::byte { 2 } };
    ChunkList chunks;
    EXPECT_EQ(parse_png_chunks(tiny, &chunks).status,
              PngStatus::InvalidHeader);

    std::vector<std::byte> png = make_minimal_png();
    png[1] = std::byte { 'Q' };
    EXPECT_FALSE(has_png_signature(png));
    EXPECT_EQ(parse_png_chunks(png, &chunks).status,
              PngStatus::InvalidHeader);
}


TEST(PngChunks, DetectsEveryBitFlip)
{
    const std::vector<std::byte> png = make_minimal_png();
    // Length field excluded: changing it moves the CRC window.
    const size_t begin = kPngSignatureSize + 4;
    const size_t end   = kPngSignatureSize + 12 + 13 + 12 + 15;

    ChunkList chunks;
    for (size_t i = begin; i < end; ++i) {
        if (i >= kPngSignatureSize + 12 + 13
            && i < kPngSignatureSize + 12 + 13 + 4) {
            continue;
        }
        for (uint32_t bit = 0; bit < 8; ++bit) {
            std::vector<std::byte> damaged = png;
            damaged[i] ^= std::byte { static_cast<uint8_t>(1U << bit) };
            const PngResult res = parse_png_chunks(damaged, &chunks);
            EXPECT_EQ(res.status, PngStatus::IntegrityError)
                << "byte " << i << " bit " << bit;
        }
    }
    EXPECT_TRUE(chunks.empty());
}


TEST(PngChunks, ReportsCorruptChunkPosition)
{
    std::vector<std::byte> png = make_minimal_png();
    // First byte of the tEXt payload.
    const size_t text_off = kPngSignatureSize + 12 + 13;
    png[text_off + 8] ^= std::byte { 0x01 };

    ChunkList chunks;
    const PngResult res = parse_png_chunks(png, &chunks);
    EXPECT_EQ(res.status, PngStatus::IntegrityError);
    EXPECT_EQ(res.chunk_type, kChunkText);
    EXPECT_EQ(res.chunk_index, 1U);
    EXPECT_EQ(res.offset, text_off);
}


TEST(PngChunks, Truncation)
{
    const std::vector<std::byte> png = make_minimal_png();
    ChunkList chunks;

    const std::vector<std::byte> signature_only = png_signature();
    EXPECT_EQ(parse_png_chunks(signature_only, &chunks).status,
              PngStatus::MissingTerminator);

    // Ends cleanly after IHDR.
    std::vector<std::byte> cut(png.begin(),
                               png.begin() + kPngSignatureSize + 12 + 13);
    EXPECT_EQ(parse_png_chunks(cut, &chunks).status,
              PngStatus::MissingTerminator);

    // Ends inside the next length field.
    cut.assign(png.begin(), png.begin() + kPngSignatureSize + 12 + 13 + 3);
    EXPECT_EQ(parse_png_chunks(cut, &chunks).status,
              PngStatus::TruncatedData);

    // Ends inside the tEXt payload.
    cut.assign(png.begin(), png.begin() + kPngSignatureSize + 12 + 13 + 12);
    EXPECT_EQ(parse_png_chunks(cut, &chunks).status,
              PngStatus::TruncatedData);

    std::vector<std::byte> huge = png_signature();
    append_u32be(&huge, 0xFFFFFFFFU);
    append_bytes(&huge, "IDAT");
    EXPECT_EQ(parse_png_chunks(huge, &chunks).status,
              PngStatus::TruncatedData);
    EXPECT_TRUE(chunks.empty());
}


TEST(PngChunks, PassesUnknownChunksThrough)
{
    std::vector<std::byte> png = png_signature();
    append_png_chunk(&png, "IHDR", kIhdr);
    append_png_chunk(&png, "gAMA", std::string_view("\0\0\xB1\x8F", 4));
    append_png_chunk(&png, "prVt", "private");
    append_png_chunk(&png, "IEND", {});

    ChunkList chunks;
    ASSERT_EQ(parse_png_chunks(png, &chunks).status, PngStatus::Ok);
    ASSERT_EQ(chunks.size(), 4U);
    EXPECT_EQ(chunk_kind(chunks[1].type), ChunkKind::Unknown);
    EXPECT_EQ(chunk_type_name(chunks[2].type), "prVt");

    std::vector<std::byte> again;
    ASSERT_EQ(serialize_png_chunks(chunks, &again).status, PngStatus::Ok);
    EXPECT_EQ(again, png);
}


TEST(PngChunks, StopsAtIend)
{
    std::vector<std::byte> png = make_minimal_png();
    append_bytes(&png, "trailing garbage");

    ChunkList chunks;
    ASSERT_EQ(parse_png_chunks(png, &chunks).status, PngStatus::Ok);
    EXPECT_EQ(chunks.size(), 4U);
}


TEST(PngChunks, RejectsInvalidTypeAndIendPayload)
{
    ChunkList chunks;

    std::vector<std::byte> png = png_signature();
    append_png_chunk(&png, "IHDR", kIhdr);
    append_png_chunk(&png, "12ab", "x");
    append_png_chunk(&png, "IEND", {});
    const PngResult bad_type = parse_png_chunks(png, &chunks);
    EXPECT_EQ(bad_type.status, PngStatus::InvalidChunkType);
    EXPECT_EQ(bad_type.chunk_index, 1U);

    png = png_signature();
    append_png_chunk(&png, "IHDR", kIhdr);
    append_png_chunk(&png, "IEND", "x");
    EXPECT_EQ(parse_png_chunks(png, &chunks).status, PngStatus::InvalidLength);
    EXPECT_TRUE(chunks.empty());
}


TEST(PngChunks, EnforcesLimits)
{
    const std::vector<std::byte> png = make_minimal_png();
    ChunkList chunks;

    ParseOptions options;
    options.limits.max_chunks = 3;
    EXPECT_EQ(parse_png_chunks(png, &chunks, options).status,
              PngStatus::LimitExceeded);

    options                        = ParseOptions {};
    options.limits.max_chunk_bytes = 8;
    const PngResult res            = parse_png_chunks(png, &chunks, options);
    EXPECT_EQ(res.status, PngStatus::LimitExceeded);
    EXPECT_EQ(res.chunk_type, kChunkIhdr);

    options.limits.max_chunk_bytes = 15;
    EXPECT_EQ(parse_png_chunks(png, &chunks, options).status, PngStatus::Ok);
}


TEST(PngChunks, SerializeRejectsInvalidType)
{
    ChunkList chunks(2);
    chunks[0].type = kChunkIhdr;
    chunks[1].type = fourcc('b', 'a', 'd', '!');

    std::vector<std::byte> out = png_signature();
    const PngResult res        = serialize_png_chunks(chunks, &out);
    EXPECT_EQ(res.status, PngStatus::InvalidChunkType);
    EXPECT_EQ(res.chunk_index, 1U);
    EXPECT_EQ(out.size(), kPngSignatureSize);
}


TEST(PngChunks, SerializeEmptyListIsSignature)
{
    std::vector<std::byte> out;
    ASSERT_EQ(serialize_png_chunks({}, &out).status, PngStatus::Ok);
    EXPECT_EQ(out, png_signature());
}

}  // namespace pngmeta
