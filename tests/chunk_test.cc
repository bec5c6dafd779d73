#include "pngmeta/chunk.h"
#include "pngmeta/png_status.h"

#include <gtest/gtest.h>

namespace pngmeta {

TEST(Chunk, KindAndCardinality)
{
    EXPECT_EQ(chunk_kind(kChunkIhdr), ChunkKind::Ihdr);
    EXPECT_EQ(chunk_kind(kChunkItxt), ChunkKind::Itxt);
    EXPECT_EQ(chunk_kind(fourcc('g', 'A', 'M', 'A')), ChunkKind::Unknown);

    EXPECT_EQ(chunk_cardinality(ChunkKind::Text), ChunkCardinality::Multiple);
    EXPECT_EQ(chunk_cardinality(ChunkKind::Ztxt), ChunkCardinality::Multiple);
    EXPECT_EQ(chunk_cardinality(ChunkKind::Itxt), ChunkCardinality::Multiple);
    EXPECT_EQ(chunk_cardinality(ChunkKind::Idat), ChunkCardinality::Multiple);
    EXPECT_EQ(chunk_cardinality(ChunkKind::Phys), ChunkCardinality::Single);
    EXPECT_EQ(chunk_cardinality(ChunkKind::Ihdr), ChunkCardinality::Single);
    EXPECT_EQ(chunk_cardinality(ChunkKind::Unknown), ChunkCardinality::Single);

    EXPECT_TRUE(is_text_chunk(kChunkZtxt));
    EXPECT_FALSE(is_text_chunk(kChunkPhys));
}


TEST(Chunk, CriticalBit)
{
    EXPECT_TRUE(is_critical_chunk(kChunkIhdr));
    EXPECT_TRUE(is_critical_chunk(kChunkIdat));
    EXPECT_FALSE(is_critical_chunk(kChunkText));
    EXPECT_FALSE(is_critical_chunk(kChunkPhys));
}


TEST(Chunk, TypeNames)
{
    EXPECT_TRUE(is_valid_chunk_type(kChunkPhys));
    EXPECT_FALSE(is_valid_chunk_type(fourcc('1', '2', '3', '4')));
    EXPECT_FALSE(is_valid_chunk_type(fourcc('t', 'E', 'X', ' ')));

    EXPECT_EQ(chunk_type_name(kChunkZtxt), "zTXt");
    EXPECT_EQ(chunk_type_name(0x00414243U), "?ABC");

    EXPECT_EQ(chunk_type_from_name("tIME"), fourcc('t', 'I', 'M', 'E'));
    EXPECT_EQ(chunk_type_from_name("pHYs"), kChunkPhys);
    EXPECT_EQ(chunk_type_from_name("tEX"), 0U);
    EXPECT_EQ(chunk_type_from_name("tEX1"), 0U);
}


TEST(PngStatus, ResultMessage)
{
    EXPECT_STREQ(png_status_name(PngStatus::IntegrityError),
                 "integrity_error");

    PngResult res;
    EXPECT_EQ(format_result_message(res), "ok");

    res.status      = PngStatus::MissingSeparator;
    res.chunk_type  = kChunkText;
    res.chunk_index = 3;
    EXPECT_EQ(format_result_message(res),
              "missing_separator [chunk=tEXt index=3]");

    res             = PngResult {};
    res.status      = PngStatus::TruncatedData;
    res.offset      = 33;
    EXPECT_EQ(format_result_message(res), "truncated_data [offset=33]");
}

}  // namespace pngmeta
