// =============================================================================
// UTF-8 Utility Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lambdalang/util/utf8.hpp"

using namespace lambdalang::util;

TEST(Utf8Test, SplitsMixedWidthCharacters) {
    auto chars = split_utf8("a\xCE\xBB\xE4\xB8\xAD");  // a λ 中

    ASSERT_EQ(chars.size(), 3u);
    EXPECT_EQ(chars[0].codepoint, static_cast<uint32_t>('a'));
    EXPECT_EQ(chars[1].codepoint, 0x03BBu);
    EXPECT_EQ(chars[2].codepoint, 0x4E2Du);

    EXPECT_EQ(chars[0].offset, 0u);
    EXPECT_EQ(chars[1].offset, 1u);
    EXPECT_EQ(chars[2].offset, 3u);
    EXPECT_EQ(chars[2].size, 3u);
}

// Invalid bytes still advance by exactly one byte so spans tile the input
TEST(Utf8Test, InvalidBytesBecomeReplacementCharacters) {
    std::string data = "a\xFF\xE4\xB8";  // stray byte, truncated sequence
    auto chars = split_utf8(data);

    ASSERT_EQ(chars.size(), 4u);
    EXPECT_EQ(chars[1].codepoint, 0xFFFDu);
    EXPECT_EQ(chars[2].codepoint, 0xFFFDu);

    size_t covered = 0;
    for (const auto& c : chars) {
        EXPECT_EQ(c.offset, covered);
        covered += c.size;
    }
    EXPECT_EQ(covered, data.size());
}

TEST(Utf8Test, Whitespace) {
    EXPECT_TRUE(is_space(' '));
    EXPECT_TRUE(is_space('\t'));
    EXPECT_TRUE(is_space('\n'));
    EXPECT_TRUE(is_space(0x3000));  // ideographic space
    EXPECT_TRUE(is_space(0x00A0));
    EXPECT_FALSE(is_space('a'));
    EXPECT_FALSE(is_space('{'));
}
