// Copyright 2026 The ocrgrab Authors
// Tests for: NULL handling, invalid parameters and error state of the C API.

#include <cstring>
#include <string>

#include "gtest/gtest.h"
#include "ocrgrab/ocrgrab.h"

#include "test_util.h"

class ValidationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ctx_ = ocrgrab_context_create_with_config(
        ocrgrab_test::WriteTestConfig(dir_).c_str());
    ASSERT_NE(ctx_, nullptr);
  }

  void TearDown() override {
    ocrgrab_context_destroy(ctx_);
    ocrgrab_shutdown_logging();
  }

  ocrgrab_test::TempDir dir_;
  OcrGrabContext* ctx_ = nullptr;
};

// ---------------------------------------------------------------------------
// NULL context
// ---------------------------------------------------------------------------

TEST(NullContextTest, SettersRejectNullContext) {
  EXPECT_EQ(ocrgrab_set_daemon_url(nullptr, "http://x"),
            kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_model(nullptr, "m"), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_timeout(nullptr, 10), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_output_dir(nullptr, "/tmp"),
            kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_editor(nullptr, "vi"), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_open_editor(nullptr, 1), kOcrGrabErrorInvalidParam);
}

TEST(NullContextTest, GettersTolerateNullContext) {
  EXPECT_EQ(ocrgrab_get_last_error(nullptr), kOcrGrabErrorInvalidParam);
  EXPECT_NE(ocrgrab_get_last_error_message(nullptr), nullptr);
  EXPECT_EQ(ocrgrab_get_output_dir(nullptr), nullptr);
  EXPECT_EQ(ocrgrab_sanitizer_is_available(nullptr), 0);
  ocrgrab_context_destroy(nullptr);
}

TEST(NullContextTest, RunWithNullContextFillsResult) {
  OcrGrabRunResult result;
  std::memset(&result, 0xAB, sizeof(result));
  EXPECT_EQ(ocrgrab_run(nullptr, kOcrGrabModeText, &result),
            kOcrGrabErrorInvalidParam);
  EXPECT_EQ(result.error, kOcrGrabErrorInvalidParam);
  EXPECT_EQ(result.state, kOcrGrabStateFailed);
  EXPECT_EQ(result.image_path, nullptr);
  EXPECT_EQ(result.text_path, nullptr);
  EXPECT_EQ(result.text, nullptr);
  ocrgrab_run_result_free(&result);
}

TEST(NullContextTest, RunResultFreeAcceptsNull) {
  ocrgrab_run_result_free(nullptr);
  OcrGrabRunResult empty = {};
  ocrgrab_run_result_free(&empty);
  ocrgrab_run_result_free(&empty);
}

// ---------------------------------------------------------------------------
// Stateless helpers
// ---------------------------------------------------------------------------

TEST(StatelessValidationTest, ModeParseRequiresOutput) {
  EXPECT_EQ(ocrgrab_mode_parse("text", nullptr), kOcrGrabErrorInvalidParam);
}

TEST(StatelessValidationTest, TextPathRejectsBadArguments) {
  char buf[16];
  EXPECT_EQ(ocrgrab_text_path_for_image(nullptr, buf, sizeof(buf)), -1);
  EXPECT_EQ(ocrgrab_text_path_for_image("", buf, sizeof(buf)), -1);
  EXPECT_EQ(ocrgrab_text_path_for_image("a.png", nullptr, 8), -1);
  EXPECT_EQ(ocrgrab_text_path_for_image("a.png", buf, -1), -1);
}

TEST(StatelessValidationTest, TextPathReportsLengthAndTruncates) {
  EXPECT_EQ(ocrgrab_text_path_for_image("shot.png", nullptr, 0), 8);

  char small[5];
  EXPECT_EQ(ocrgrab_text_path_for_image("shot.png", small, sizeof(small)), 8);
  EXPECT_STREQ(small, "shot");

  char big[32];
  EXPECT_EQ(ocrgrab_text_path_for_image("shot.png", big, sizeof(big)), 8);
  EXPECT_STREQ(big, "shot.txt");
}

// ---------------------------------------------------------------------------
// Setter validation
// ---------------------------------------------------------------------------

TEST_F(ValidationTest, NullStringsAreRejected) {
  EXPECT_EQ(ocrgrab_set_daemon_url(ctx_, nullptr), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_get_last_error(ctx_), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_model(ctx_, nullptr), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_output_dir(ctx_, nullptr), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_editor(ctx_, nullptr), kOcrGrabErrorInvalidParam);
}

TEST_F(ValidationTest, EmptyValuesAreRejected) {
  EXPECT_EQ(ocrgrab_set_daemon_url(ctx_, ""), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_model(ctx_, ""), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_output_dir(ctx_, ""), kOcrGrabErrorInvalidParam);
}

TEST_F(ValidationTest, NonPositiveTimeoutIsRejected) {
  EXPECT_EQ(ocrgrab_set_timeout(ctx_, 0), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_timeout(ctx_, -5), kOcrGrabErrorInvalidParam);
  EXPECT_NE(std::string(ocrgrab_get_last_error_message(ctx_))
                .find("timeout_seconds"),
            std::string::npos);
  EXPECT_EQ(ocrgrab_set_timeout(ctx_, 30), kOcrGrabOk);
  EXPECT_EQ(ocrgrab_get_last_error(ctx_), kOcrGrabOk);
}

TEST_F(ValidationTest, EmptyEditorMeansPlatformDefault) {
  EXPECT_EQ(ocrgrab_set_editor(ctx_, ""), kOcrGrabOk);
}

TEST_F(ValidationTest, SuccessClearsLastError) {
  ASSERT_EQ(ocrgrab_set_model(ctx_, ""), kOcrGrabErrorInvalidParam);
  EXPECT_EQ(ocrgrab_set_model(ctx_, "glm-ocr"), kOcrGrabOk);
  EXPECT_EQ(ocrgrab_get_last_error(ctx_), kOcrGrabOk);
  EXPECT_STREQ(ocrgrab_get_last_error_message(ctx_), "No error");
}

// ---------------------------------------------------------------------------
// Run validation
// ---------------------------------------------------------------------------

TEST_F(ValidationTest, InvalidModeFailsBeforeCapture) {
  OcrGrabRunResult result;
  OcrGrabError err =
      ocrgrab_run(ctx_, static_cast<OcrGrabMode>(42), &result);
  EXPECT_EQ(err, kOcrGrabErrorInvalidParam);
  EXPECT_EQ(result.error, kOcrGrabErrorInvalidParam);
  EXPECT_EQ(result.state, kOcrGrabStateFailed);
  EXPECT_EQ(result.failed_in, kOcrGrabStateIdle);
  EXPECT_EQ(result.image_path, nullptr);
  ASSERT_NE(result.message, nullptr);
  EXPECT_NE(std::string(result.message).find("mode"), std::string::npos);
  ocrgrab_run_result_free(&result);

  // Nothing was captured.
  EXPECT_TRUE(dir_.List("Screenshot_").empty());
}
