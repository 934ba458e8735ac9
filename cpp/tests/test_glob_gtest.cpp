// ==============================================================================
// test_glob_gtest.cpp - Тесты wildcard-сопоставления (GoogleTest)
// ==============================================================================

#include "fontlist/glob.hpp"

#include <gtest/gtest.h>
#include <string>
#include <string_view>

namespace fontlist::search::test {

namespace {

bool match_once(std::string_view pattern, std::string_view text) {
    return GlobPattern(pattern).matches(text);
}

}  // namespace

// ==============================================================================
// Базовые метасимволы
// ==============================================================================

TEST(GlobTest, Star_MatchesEverything) {
    GlobPattern p("*");

    EXPECT_TRUE(p.matches("Arial.ttf"));
    EXPECT_TRUE(p.matches(".hidden"));
    EXPECT_TRUE(p.matches(""));
}

TEST(GlobTest, StarSuffix_MatchesPrefix) {
    GlobPattern p("Arial*");

    EXPECT_TRUE(p.matches("Arial.ttf"));
    EXPECT_TRUE(p.matches("ArialBold.ttf"));
    EXPECT_TRUE(p.matches("Arial"));
    EXPECT_FALSE(p.matches("Calibri.ttf"));
    EXPECT_FALSE(p.matches("MyArial.ttf"));
}

TEST(GlobTest, StarInMiddle_Backtracks) {
    GlobPattern p("*Bold*.ttf");

    EXPECT_TRUE(p.matches("ArialBold.ttf"));
    EXPECT_TRUE(p.matches("Bold.ttf"));
    EXPECT_TRUE(p.matches("BoldBold.ttf.ttf"));
    EXPECT_FALSE(p.matches("ArialBold.otf"));
}

TEST(GlobTest, ConsecutiveStars_SameAsOne) {
    EXPECT_TRUE(match_once("a**b", "ab"));
    EXPECT_TRUE(match_once("a***b", "aXYZb"));
    EXPECT_FALSE(match_once("a**b", "aXYZ"));
}

TEST(GlobTest, QuestionMark_ExactlyOneChar) {
    GlobPattern p("Font?.ttf");

    EXPECT_TRUE(p.matches("Font1.ttf"));
    EXPECT_FALSE(p.matches("Font.ttf"));
    EXPECT_FALSE(p.matches("Font12.ttf"));
}

TEST(GlobTest, Literal_WholeNameOnly) {
    GlobPattern p("Arial");

    // Сопоставляется отображаемое имя целиком, вместе с расширением
    EXPECT_TRUE(p.matches("Arial"));
    EXPECT_FALSE(p.matches("Arial.ttf"));
}

TEST(GlobTest, EmptyPattern_MatchesOnlyEmpty) {
    GlobPattern p("");

    EXPECT_TRUE(p.matches(""));
    EXPECT_FALSE(p.matches("a"));
}

TEST(GlobTest, Pattern_KeepsSource) {
    GlobPattern p("[A-C]*.ttf");

    EXPECT_EQ(p.pattern(), "[A-C]*.ttf");
}

// ==============================================================================
// Регистр
// ==============================================================================

TEST(GlobTest, CaseInsensitive_Literals) {
    EXPECT_TRUE(match_once("arial*", "ARIAL.TTF"));
    EXPECT_TRUE(match_once("*.TTF", "arial.ttf"));
    EXPECT_TRUE(match_once("CaLiBrI.ttf", "calibri.TTF"));
}

TEST(GlobTest, CaseInsensitive_Classes) {
    EXPECT_TRUE(match_once("[a-c]*", "Calibri.ttf"));
    EXPECT_TRUE(match_once("[A-C]*", "arial.ttf"));
    EXPECT_FALSE(match_once("[a-c]*", "Times.ttf"));
}

// ==============================================================================
// Наборы символов
// ==============================================================================

TEST(GlobTest, Class_ExplicitSet) {
    GlobPattern p("Font[123].ttf");

    EXPECT_TRUE(p.matches("Font2.ttf"));
    EXPECT_FALSE(p.matches("Font4.ttf"));
}

TEST(GlobTest, Class_Negated) {
    EXPECT_TRUE(match_once("Font[!0-9].ttf", "FontA.ttf"));
    EXPECT_FALSE(match_once("Font[!0-9].ttf", "Font5.ttf"));
    EXPECT_TRUE(match_once("Font[^0-9].ttf", "FontB.ttf"));
    EXPECT_FALSE(match_once("Font[^0-9].ttf", "Font7.ttf"));
}

TEST(GlobTest, Class_LeadingBracketIsLiteral) {
    EXPECT_TRUE(match_once("[]]x", "]x"));
    EXPECT_TRUE(match_once("[!]]x", "ax"));
    EXPECT_FALSE(match_once("[!]]x", "]x"));
}

TEST(GlobTest, Class_TrailingDashIsLiteral) {
    EXPECT_TRUE(match_once("a[b-]c", "a-c"));
    EXPECT_TRUE(match_once("a[b-]c", "abc"));
    EXPECT_FALSE(match_once("a[b-]c", "axc"));
}

TEST(GlobTest, UnclosedBracket_IsLiteral) {
    EXPECT_TRUE(match_once("[abc", "[abc"));
    EXPECT_FALSE(match_once("[abc", "a"));
    EXPECT_TRUE(match_once("Font[*", "Font[Bold"));
}

// ==============================================================================
// UTF-8
// ==============================================================================

TEST(GlobTest, Utf8_QuestionMarkIsOneCodePoint) {
    // "Шрифт.ttf"
    const std::string name = "\xd0\xa8\xd1\x80\xd0\xb8\xd1\x84\xd1\x82.ttf";

    EXPECT_TRUE(match_once("?????.ttf", name));
    EXPECT_FALSE(match_once("??????????.ttf", name));
}

TEST(GlobTest, Utf8_NonAsciiLiteral) {
    // "Шрифт*"
    const std::string pattern = "\xd0\xa8\xd1\x80\xd0\xb8\xd1\x84\xd1\x82*";
    const std::string name = "\xd0\xa8\xd1\x80\xd0\xb8\xd1\x84\xd1\x82 Bold.otf";

    EXPECT_TRUE(match_once(pattern, name));
    EXPECT_FALSE(match_once(pattern, "Arial.ttf"));
}

TEST(GlobTest, DecodeUtf8_ValidSequences) {
    // "A", "Ш", "€", U+1F600
    std::u32string cps = decode_utf8("A\xd0\xa8\xe2\x82\xac\xf0\x9f\x98\x80");

    ASSERT_EQ(cps.size(), 4u);
    EXPECT_EQ(cps[0], U'A');
    EXPECT_EQ(cps[1], static_cast<char32_t>(0x0428));
    EXPECT_EQ(cps[2], static_cast<char32_t>(0x20AC));
    EXPECT_EQ(cps[3], static_cast<char32_t>(0x1F600));
}

TEST(GlobTest, DecodeUtf8_InvalidBytesKeptAsIs) {
    std::u32string cps = decode_utf8("a\xff\xd0");

    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[0], U'a');
    EXPECT_EQ(cps[1], static_cast<char32_t>(0xFF));
    EXPECT_EQ(cps[2], static_cast<char32_t>(0xD0));
}

TEST(GlobTest, InvalidUtf8_StillMatchable) {
    EXPECT_TRUE(match_once("*", "bad\xff.ttf"));
    EXPECT_TRUE(match_once("bad?.ttf", "bad\xff.ttf"));
}

}  // namespace fontlist::search::test
