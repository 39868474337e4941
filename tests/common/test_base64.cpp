/**
 * @file test_base64.cpp
 * @brief Base64 encoding and random source tests
 */

#include "cvec/common.hpp"

#include <cstdint>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

using namespace cvec::common;

namespace {

std::string encode_text(std::string_view text)
{
    std::vector<std::uint8_t> bytes(text.begin(), text.end());
    return base64_encode(bytes);
}

}  // namespace

TEST(Base64, Rfc4648Vectors)
{
    EXPECT_EQ(encode_text(""), "");
    EXPECT_EQ(encode_text("f"), "Zg==");
    EXPECT_EQ(encode_text("fo"), "Zm8=");
    EXPECT_EQ(encode_text("foo"), "Zm9v");
    EXPECT_EQ(encode_text("foob"), "Zm9vYg==");
    EXPECT_EQ(encode_text("fooba"), "Zm9vYmE=");
    EXPECT_EQ(encode_text("foobar"), "Zm9vYmFy");
}

TEST(Base64, UsesPlusAndSlash)
{
    const std::vector<std::uint8_t> bytes = {0xFB, 0xFF, 0xBF};
    EXPECT_EQ(base64_encode(bytes), "+/+/");
}

TEST(Base64, BaseIdentifierLengths)
{
    // 12 bytes encode to 16 characters without padding
    EXPECT_EQ(base64_encode(std::vector<std::uint8_t>(12, 0)).size(), 16u);
    // 16 bytes encode to 24 characters, the last two being padding
    auto v2 = base64_encode(std::vector<std::uint8_t>(16, 0xAB));
    EXPECT_EQ(v2.size(), 24u);
    EXPECT_EQ(v2.substr(22), "==");
}

TEST(RandomBytes, RequestedLength)
{
    EXPECT_TRUE(random_bytes(0).empty());
    EXPECT_EQ(random_bytes(1).size(), 1u);
    EXPECT_EQ(random_bytes(12).size(), 12u);
    EXPECT_EQ(random_bytes(17).size(), 17u);
}

TEST(RandomBytes, Varies)
{
    std::set<std::vector<std::uint8_t>> seen;
    for (int i = 0; i < 32; ++i) {
        seen.insert(random_bytes(16));
    }
    EXPECT_EQ(seen.size(), 32u);
}
