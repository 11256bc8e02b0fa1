#include "carkit/text_format.h"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <string>

namespace carkit {

TEST(TextFormat, ConsoleEscapes)
{
    std::string out;
    EXPECT_FALSE(append_console_escaped_ascii("plain", 0, &out));
    EXPECT_EQ(out, "plain");

    out.clear();
    EXPECT_TRUE(append_console_escaped_ascii("a\tb\n\x01\xC3", 0, &out));
    EXPECT_EQ(out, "a\\tb\\n\\x01\\xC3");

    out.clear();
    EXPECT_TRUE(append_console_escaped_ascii("abcdef", 3, &out));
    EXPECT_EQ(out, "abc...");
}


TEST(TextFormat, HexBytes)
{
    const std::array<std::byte, 3> bytes = { std::byte { 0x00 },
                                             std::byte { 0xAB },
                                             std::byte { 0x7F } };
    std::string out;
    append_hex_bytes(bytes, 0, &out);
    EXPECT_EQ(out, "00AB7F");

    out.clear();
    append_hex_bytes(bytes, 2, &out);
    EXPECT_EQ(out, "00AB...");
}


TEST(TextFormat, FourCc)
{
    std::string out;
    append_fourcc(0x41524742U, &out);
    EXPECT_EQ(out, "ARGB");

    out.clear();
    append_fourcc(0x47382020U, &out);
    EXPECT_EQ(out, "G8  ");

    out.clear();
    append_fourcc(0x41000142U, &out);
    EXPECT_EQ(out, "A..B");
}

}  // namespace carkit
