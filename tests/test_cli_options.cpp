// Copyright 2026 The ocrgrab Authors
// Tests for: command-line parsing of the ocrgrab executable

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "core/cli_options.h"

namespace {

bool Parse(std::vector<const char*> args, CliOptions* options,
           std::string* error) {
  args.insert(args.begin(), "ocrgrab");
  return ParseCliOptions(static_cast<int>(args.size()), args.data(), options,
                         error);
}

}  // namespace

TEST(CliOptionsTest, DefaultsToTextMode) {
  CliOptions o;
  std::string error;
  ASSERT_TRUE(Parse({}, &o, &error));
  EXPECT_EQ(o.mode, kOcrGrabModeText);
  EXPECT_TRUE(o.config_path.empty());
  EXPECT_FALSE(o.verbose);
  EXPECT_FALSE(o.no_editor);
}

TEST(CliOptionsTest, PositionalMode) {
  CliOptions o;
  std::string error;
  ASSERT_TRUE(Parse({"table"}, &o, &error));
  EXPECT_EQ(o.mode, kOcrGrabModeTable);
}

TEST(CliOptionsTest, DashedModeWords) {
  CliOptions o;
  std::string error;
  ASSERT_TRUE(Parse({"--figure", "-v"}, &o, &error)) << error;
  EXPECT_EQ(o.mode, kOcrGrabModeFigure);
  EXPECT_TRUE(o.verbose);
}

TEST(CliOptionsTest, ConfigForms) {
  CliOptions a;
  std::string error;
  ASSERT_TRUE(Parse({"-c", "/tmp/a.ini", "text"}, &a, &error));
  EXPECT_EQ(a.config_path, "/tmp/a.ini");

  CliOptions b;
  ASSERT_TRUE(Parse({"--config=/tmp/b.ini"}, &b, &error));
  EXPECT_EQ(b.config_path, "/tmp/b.ini");
}

TEST(CliOptionsTest, ConfigRequiresValue) {
  CliOptions o;
  std::string error;
  EXPECT_FALSE(Parse({"--config"}, &o, &error));
  EXPECT_NE(error.find("requires"), std::string::npos);
  EXPECT_FALSE(Parse({"--config="}, &o, &error));
}

TEST(CliOptionsTest, FlagsAreRecognized) {
  CliOptions o;
  std::string error;
  ASSERT_TRUE(Parse({"--no-editor", "--version", "--help"}, &o, &error));
  EXPECT_TRUE(o.no_editor);
  EXPECT_TRUE(o.show_version);
  EXPECT_TRUE(o.show_help);
}

TEST(CliOptionsTest, UnknownModeIsUsageError) {
  CliOptions o;
  std::string error;
  EXPECT_FALSE(Parse({"diagram"}, &o, &error));
  EXPECT_EQ(error, "Unknown recognition mode: diagram");
}

TEST(CliOptionsTest, UnknownOptionIsUsageError) {
  CliOptions o;
  std::string error;
  EXPECT_FALSE(Parse({"--frobnicate"}, &o, &error));
  EXPECT_EQ(error, "Unknown option: --frobnicate");
}

TEST(CliOptionsTest, SecondModeIsRejected) {
  CliOptions o;
  std::string error;
  EXPECT_FALSE(Parse({"text", "table"}, &o, &error));
  EXPECT_NE(error.find("table"), std::string::npos);
}
