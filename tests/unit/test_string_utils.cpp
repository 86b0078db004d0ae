#include <gtest/gtest.h>
#include "utils/base64.hpp"
#include "utils/string_utils.hpp"

using namespace meddictate::utils;

TEST(StringUtilsTest, ToLowerFoldsUmlauts) {
    EXPECT_EQ(toLower("ÄRZTLICHER Befund ÜBER Öl"), "ärztlicher befund über öl");
    EXPECT_EQ(toLower("Straße"), "straße");
    EXPECT_EQ(toLower("Größe").size(), std::string("Größe").size());
}

TEST(StringUtilsTest, Utf8Length) {
    EXPECT_EQ(utf8Length(""), 0u);
    EXPECT_EQ(utf8Length("Befund"), 6u);
    EXPECT_EQ(utf8Length("unauffällig"), 11u);
    
    auto parts = utf8Split("für");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "ü");
}

TEST(StringUtilsTest, ReplaceWholeWord) {
    std::string text = "Mamografie links, mamografie rechts, Mamografiebefund";
    EXPECT_EQ(replaceWholeWord(text, "Mamografie", "Mammographie"), 2u);
    EXPECT_EQ(text, "Mammographie links, Mammographie rechts, Mamografiebefund");
    
    std::string untouched = "Befund";
    EXPECT_EQ(replaceWholeWord(untouched, "", "x"), 0u);
    EXPECT_EQ(replaceWholeWord(untouched, "fund", "x"), 0u);
    EXPECT_EQ(untouched, "Befund");
}

TEST(StringUtilsTest, ReplaceMultiWordVariant) {
    std::string text = "Lymph Knoten axillär";
    EXPECT_EQ(replaceWholeWord(text, "Lymph Knoten", "Lymphknoten"), 1u);
    EXPECT_EQ(text, "Lymphknoten axillär");
}

TEST(StringUtilsTest, ReplaceRespectsUmlautWordBoundary) {
    std::string text = "Züste";
    EXPECT_EQ(replaceWholeWord(text, "ste", "x"), 0u);
}

TEST(StringUtilsTest, ExtractWords) {
    auto words = extractWords("Befund: unauffällig, BI-RADS 2, T2w Läsion", 4);
    ASSERT_EQ(words.size(), 4u);
    EXPECT_EQ(words[0], "befund");
    EXPECT_EQ(words[1], "unauffällig");
    EXPECT_EQ(words[2], "rads");
    EXPECT_EQ(words[3], "läsion");
}

TEST(StringUtilsTest, ContainsIgnoreCase) {
    EXPECT_TRUE(containsIgnoreCase("Vielen Dank", "DANK"));
    EXPECT_FALSE(containsIgnoreCase("Befund", "Zyste"));
}

TEST(StringUtilsTest, TrimAndJoin) {
    EXPECT_EQ(trim("  Befund \n"), "Befund");
    EXPECT_EQ(trim(" \t "), "");
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(join({}, ", "), "");
}

TEST(StringUtilsTest, WordBytes) {
    EXPECT_TRUE(isWordByte('a'));
    EXPECT_TRUE(isWordByte('7'));
    EXPECT_TRUE(isWordByte('_'));
    EXPECT_TRUE(isWordByte(0xC3));
    EXPECT_FALSE(isWordByte(' '));
    EXPECT_FALSE(isWordByte('-'));
}

TEST(Base64Test, DecodesKnownValues) {
    auto decoded = base64Decode("TWFu");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "Man");
    
    decoded = base64Decode("TWE=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "Ma");
    
    decoded = base64Decode("TQ==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->size(), 1u);
    
    decoded = base64Decode("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(Base64Test, SkipsWhitespace) {
    auto decoded = base64Decode("TW\nFu\r\n");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->size(), 3u);
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_FALSE(base64Decode("TWF").has_value());
    EXPECT_FALSE(base64Decode("TW!u").has_value());
    EXPECT_FALSE(base64Decode("T===").has_value());
    EXPECT_FALSE(base64Decode("TQ==TWFu").has_value());
    EXPECT_FALSE(base64Decode("TW=u").has_value());
}

TEST(Base64Test, EncodesBinary) {
    std::vector<uint8_t> data = {0x00, 0xFF, 0x10, 0x80};
    EXPECT_EQ(base64Encode(data), "AP8QgA==");
    EXPECT_EQ(base64Decode(base64Encode(data)).value(), data);
}
