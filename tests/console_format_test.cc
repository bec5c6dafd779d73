#include "pngmeta/console_format.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace pngmeta {
namespace {

    TEST(ConsoleFormat, PlainTextUnchanged)
    {
        std::string out;
        EXPECT_FALSE(append_console_escaped("John Doe", 0, &out));
        EXPECT_EQ(out, "John Doe");
    }


    TEST(ConsoleFormat, EscapesControlsAndQuotes)
    {
        std::string out;
        EXPECT_TRUE(append_console_escaped(std::string("a\nb\x01\"", 5), 0,
                                           &out));
        EXPECT_EQ(out, "a\\nb\\x01\\\"");
    }


    TEST(ConsoleFormat, KeepsUtf8AndEscapesInvalidBytes)
    {
        std::string out;
        EXPECT_FALSE(append_console_escaped("Caf\xC3\xA9", 0, &out));
        EXPECT_EQ(out, "Caf\xC3\xA9");

        out.clear();
        EXPECT_TRUE(append_console_escaped("x\xE9y", 0, &out));
        EXPECT_EQ(out, "x\\xE9y");

        // U+0085 is a C1 control.
        out.clear();
        EXPECT_TRUE(append_console_escaped("\xC2\x85", 0, &out));
        EXPECT_EQ(out, "\\xC2\\x85");
    }


    TEST(ConsoleFormat, Truncates)
    {
        std::string out;
        EXPECT_TRUE(append_console_escaped("abcdef", 3, &out));
        EXPECT_EQ(out, "abc...");
    }


    TEST(ConsoleFormat, HexBytes)
    {
        const std::vector<std::byte> bytes = { std::byte { 0x00 },
                                               std::byte { 0x0B },
                                               std::byte { 0x13 },
                                               std::byte { 0xFF } };
        std::string out;
        append_hex_bytes(bytes, 0, &out);
        EXPECT_EQ(out, "000B13FF");

        out.clear();
        append_hex_bytes(bytes, 2, &out);
        EXPECT_EQ(out, "000B...");
    }

}  // namespace
}  // namespace pngmeta
