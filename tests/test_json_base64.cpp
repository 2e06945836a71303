// Copyright 2026 The ocrgrab Authors
// Tests for: JsonQuote, JsonGetString, JsonGetInt64, JsonFindKey,
//            Base64Encode

#include <cstdint>
#include <string>

#include "gtest/gtest.h"

#include "core/base64.h"
#include "core/json_util.h"

using ocrgrab::internal::Base64Encode;
using ocrgrab::internal::JsonFindKey;
using ocrgrab::internal::JsonGetInt64;
using ocrgrab::internal::JsonGetString;
using ocrgrab::internal::JsonQuote;

// ---------------------------------------------------------------------------
// JsonQuote
// ---------------------------------------------------------------------------

TEST(JsonTest, QuoteEscapesSpecialCharacters) {
  EXPECT_EQ(JsonQuote("plain"), "\"plain\"");
  EXPECT_EQ(JsonQuote("a\"b\\c"), "\"a\\\"b\\\\c\"");
  EXPECT_EQ(JsonQuote("line\nnext\ttab"), "\"line\\nnext\\ttab\"");
  EXPECT_EQ(JsonQuote(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(JsonTest, QuotePassesUtf8Through) {
  EXPECT_EQ(JsonQuote("\xE4\xB8\xAD\xE6\x96\x87"),
            "\"\xE4\xB8\xAD\xE6\x96\x87\"");
}

// ---------------------------------------------------------------------------
// JsonGetString
// ---------------------------------------------------------------------------

TEST(JsonTest, GetStringUnescapes) {
  std::string out;
  ASSERT_TRUE(JsonGetString(
      R"({"model":"glm-ocr","response":"| a | b |\n|---|---|\n\"q\" \\ /"})",
      "response", &out));
  EXPECT_EQ(out, "| a | b |\n|---|---|\n\"q\" \\ /");
}

TEST(JsonTest, GetStringDecodesUnicodeEscapes) {
  std::string out;
  ASSERT_TRUE(JsonGetString(R"({"r":"\u00e9\u4e2d"})", "r", &out));
  EXPECT_EQ(out, "\xC3\xA9\xE4\xB8\xAD");

  // Surrogate pair for U+1F600.
  ASSERT_TRUE(JsonGetString(R"({"r":"\ud83d\ude00"})", "r", &out));
  EXPECT_EQ(out, "\xF0\x9F\x98\x80");

  // Lone surrogate becomes U+FFFD.
  ASSERT_TRUE(JsonGetString(R"({"r":"\ud83dx"})", "r", &out));
  EXPECT_EQ(out, "\xEF\xBF\xBDx");
}

TEST(JsonTest, GetStringToleratesWhitespace) {
  std::string out;
  ASSERT_TRUE(JsonGetString("{ \"error\" :\n  \"model not found\" }", "error",
                            &out));
  EXPECT_EQ(out, "model not found");
}

TEST(JsonTest, GetStringIgnoresValuesEqualToKey) {
  std::string out;
  ASSERT_TRUE(
      JsonGetString(R"({"a":"response","response":"yes"})", "response", &out));
  EXPECT_EQ(out, "yes");
}

TEST(JsonTest, GetStringFailures) {
  std::string out = "unchanged";
  EXPECT_FALSE(JsonGetString(R"({"a":"b"})", "missing", &out));
  EXPECT_FALSE(JsonGetString(R"({"n":42})", "n", &out));
  EXPECT_FALSE(JsonGetString(R"({"s":"unterminated)", "s", &out));
  EXPECT_FALSE(JsonGetString(R"({"s":"bad \q escape"})", "s", &out));
  EXPECT_EQ(out, "unchanged");
}

// ---------------------------------------------------------------------------
// JsonGetInt64 / JsonFindKey
// ---------------------------------------------------------------------------

TEST(JsonTest, GetInt64) {
  int64_t v = 0;
  ASSERT_TRUE(JsonGetInt64(R"({"size": 6442450944,"size_vram":0})", "size",
                           &v));
  EXPECT_EQ(v, 6442450944LL);
  ASSERT_TRUE(JsonGetInt64(R"({"size": 1,"size_vram":-3})", "size_vram", &v));
  EXPECT_EQ(v, -3);
  EXPECT_FALSE(JsonGetInt64(R"({"size":"big"})", "size", &v));
}

TEST(JsonTest, FindKeyHonorsStartOffset) {
  std::string json = R"({"models":[{"name":"a"},{"name":"b"}]})";
  size_t first = JsonFindKey(json, "name");
  ASSERT_NE(first, std::string::npos);
  std::string out;
  ASSERT_TRUE(JsonGetString(json, "name", &out, first));
  EXPECT_EQ(out, "b");
  EXPECT_EQ(JsonFindKey(json, "name", JsonFindKey(json, "name", first)),
            std::string::npos);
}

// ---------------------------------------------------------------------------
// Base64Encode
// ---------------------------------------------------------------------------

TEST(Base64Test, Rfc4648Vectors) {
  auto enc = [](const std::string& s) {
    return Base64Encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
  };
  EXPECT_EQ(enc(""), "");
  EXPECT_EQ(enc("f"), "Zg==");
  EXPECT_EQ(enc("fo"), "Zm8=");
  EXPECT_EQ(enc("foo"), "Zm9v");
  EXPECT_EQ(enc("foob"), "Zm9vYg==");
  EXPECT_EQ(enc("fooba"), "Zm9vYmE=");
  EXPECT_EQ(enc("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, BinaryBytes) {
  const uint8_t png_magic[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  EXPECT_EQ(Base64Encode(png_magic, sizeof(png_magic)), "iVBORw0KGgo=");
  const uint8_t high[] = {0xFF, 0xFE, 0xFD};
  EXPECT_EQ(Base64Encode(high, sizeof(high)), "//79");
}
