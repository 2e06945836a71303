// Copyright 2026 The ocrgrab Authors
// Tests for: output file naming (TextPathForImage, SanitizedPathForImage,
//            ImageFileName, NextImagePath) and OutputWriter

#include <cctype>
#include <chrono>
#include <ctime>
#include <string>

#include "gtest/gtest.h"

#include "core/file_util.h"
#include "core/output_paths.h"
#include "core/output_writer.h"
#include "test_util.h"

using ocrgrab::internal::ImageFileName;
using ocrgrab::internal::NextImagePath;
using ocrgrab::internal::OutputWriter;
using ocrgrab::internal::SanitizedPathForImage;
using ocrgrab::internal::TextPathForImage;

namespace {

std::chrono::system_clock::time_point At(std::time_t t, int millis) {
  return std::chrono::system_clock::from_time_t(t) +
         std::chrono::milliseconds(millis);
}

bool AllDigits(const std::string& s) {
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return !s.empty();
}

}  // namespace

// ---------------------------------------------------------------------------
// Derived paths
// ---------------------------------------------------------------------------

TEST(OutputPathsTest, TextPathReplacesExtension) {
  EXPECT_EQ(TextPathForImage("/x/Screenshot_20260101_101010_001.png"),
            "/x/Screenshot_20260101_101010_001.txt");
  EXPECT_EQ(TextPathForImage("shot.jpeg"), "shot.txt");
}

TEST(OutputPathsTest, TextPathWithoutExtensionAppends) {
  EXPECT_EQ(TextPathForImage("/x/shot"), "/x/shot.txt");
  // A dot in a directory name is not an extension.
  EXPECT_EQ(TextPathForImage("/x.d/shot"), "/x.d/shot.txt");
}

TEST(OutputPathsTest, SanitizedPathSitsBesideImage) {
  EXPECT_EQ(SanitizedPathForImage("/x/shot.png"), "/x/shot.temp.jpg");
}

// ---------------------------------------------------------------------------
// ImageFileName
// ---------------------------------------------------------------------------

TEST(OutputPathsTest, ImageFileNameFormat) {
  std::time_t t = 1767262210;  // fixed instant
  std::string name = ImageFileName(At(t, 7));

  // Screenshot_YYYYMMDD_HHMMSS_mmm.png
  ASSERT_EQ(name.size(), std::string("Screenshot_20260101_101010_007.png").size());
  EXPECT_EQ(name.substr(0, 11), "Screenshot_");
  EXPECT_TRUE(AllDigits(name.substr(11, 8)));
  EXPECT_EQ(name[19], '_');
  EXPECT_TRUE(AllDigits(name.substr(20, 6)));
  EXPECT_EQ(name.substr(26), "_007.png");

  std::tm local = {};
#ifdef _WIN32
  localtime_s(&local, &t);
#else
  localtime_r(&t, &local);
#endif
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
  EXPECT_EQ(name.substr(11, 15), stamp);
}

TEST(OutputPathsTest, ImageFileNameDiffersByMillisecond) {
  std::time_t t = 1767262210;
  EXPECT_NE(ImageFileName(At(t, 1)), ImageFileName(At(t, 2)));
  EXPECT_NE(ImageFileName(At(t, 999)), ImageFileName(At(t + 1, 999)));
}

// ---------------------------------------------------------------------------
// NextImagePath
// ---------------------------------------------------------------------------

TEST(OutputPathsTest, NextImagePathAvoidsExistingPairs) {
  ocrgrab_test::TempDir dir;
  auto when = At(1767262210, 500);

  std::string first = NextImagePath(dir.path(), when);
  EXPECT_EQ(first, dir.File(ImageFileName(when)));

  ocrgrab_test::WriteTextFile(first, "png");
  std::string second = NextImagePath(dir.path(), when);
  EXPECT_NE(second, first);
  EXPECT_EQ(second.substr(second.size() - 6), "_2.png");

  // A leftover text file also blocks the name.
  ocrgrab_test::WriteTextFile(TextPathForImage(second), "txt");
  std::string third = NextImagePath(dir.path(), when);
  EXPECT_EQ(third.substr(third.size() - 6), "_3.png");
}

// ---------------------------------------------------------------------------
// OutputWriter
// ---------------------------------------------------------------------------

class OutputWriterTest : public ::testing::Test {
 protected:
  ocrgrab_test::TempDir dir_;
  ocrgrab_test::CapturingLogger log_;
  OutputWriter writer_{log_.get()};
};

TEST_F(OutputWriterTest, WritesExactBytes) {
  const std::string text = "| a | b |\n|---|---|\n| 1 | \xE4\xB8\xAD |";
  std::string out_path;
  std::string error;
  ASSERT_TRUE(writer_.Write(dir_.File("shot.png"), text, &out_path, &error))
      << error;
  EXPECT_EQ(out_path, dir_.File("shot.txt"));
  EXPECT_EQ(ocrgrab_test::ReadTextFile(out_path), text);
}

TEST_F(OutputWriterTest, OverwritesPreviousContent) {
  std::string out_path;
  ASSERT_TRUE(writer_.Write(dir_.File("shot.png"), "long old content",
                            &out_path, nullptr));
  ASSERT_TRUE(writer_.Write(dir_.File("shot.png"), "new", &out_path, nullptr));
  EXPECT_EQ(ocrgrab_test::ReadTextFile(out_path), "new");
}

TEST_F(OutputWriterTest, CreatesMissingDirectories) {
  std::string image = ocrgrab::internal::JoinPath(
      ocrgrab::internal::JoinPath(dir_.File("a"), "b"), "shot.png");
  std::string out_path;
  std::string error;
  ASSERT_TRUE(writer_.Write(image, "hello", &out_path, &error)) << error;
  EXPECT_EQ(ocrgrab_test::ReadTextFile(out_path), "hello");
}

TEST_F(OutputWriterTest, FailsWhenDirectoryIsAFile) {
  std::string blocker = dir_.File("blocker");
  ocrgrab_test::WriteTextFile(blocker, "x");
  std::string out_path = "untouched";
  std::string error;
  EXPECT_FALSE(writer_.Write(ocrgrab::internal::JoinPath(blocker, "shot.png"),
                             "hello", &out_path, &error));
  EXPECT_EQ(out_path, "untouched");
  EXPECT_FALSE(error.empty());
}
