// Copyright 2026 The ocrgrab Authors
// Tests for: ocrgrab_run end to end on Linux, with a shell script standing in
//            for the screenshot tool and a closed port for the daemon

#include <string>

#include "gtest/gtest.h"
#include "ocrgrab/ocrgrab.h"

#include "test_util.h"

class RunLinuxTest : public ::testing::Test {
 protected:
  void TearDown() override {
    ocrgrab_context_destroy(ctx_);
    ocrgrab_shutdown_logging();
  }

  OcrGrabError RunWith(const std::string& capture_command,
                       OcrGrabRunResult* result) {
    ctx_ = ocrgrab_context_create_with_config(
        ocrgrab_test::WriteTestConfig(
            dir_, "capture_command = " + capture_command + "\n")
            .c_str());
    EXPECT_NE(ctx_, nullptr);
    if (!ctx_) return kOcrGrabErrorUnknown;
    return ocrgrab_run(ctx_, kOcrGrabModeText, result);
  }

  std::string OutDir() const { return dir_.File("out"); }

  ocrgrab_test::TempDir dir_;
  OcrGrabContext* ctx_ = nullptr;
};

TEST_F(RunLinuxTest, DaemonDownKeepsImageAndWritesNoText) {
  OcrGrabRunResult r;
  OcrGrabError err = RunWith("sh -c 'printf PNG > \"$0\"' {output}", &r);
  EXPECT_EQ(err, kOcrGrabErrorDaemonUnreachable);
  EXPECT_EQ(r.error, kOcrGrabErrorDaemonUnreachable);
  EXPECT_EQ(r.state, kOcrGrabStateFailed);
  EXPECT_EQ(r.failed_in, kOcrGrabStateRecognizing);
  ASSERT_NE(r.image_path, nullptr);
  EXPECT_EQ(r.text_path, nullptr);
  EXPECT_EQ(ocrgrab_exit_code(err), 2);

  auto files = ocrgrab_test::TempDir::ListDir(OutDir());
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].compare(0, 11, "Screenshot_"), 0);
  EXPECT_EQ(files[0].substr(files[0].size() - 4), ".png");

  EXPECT_EQ(ocrgrab_get_last_error(ctx_), kOcrGrabErrorDaemonUnreachable);
  ocrgrab_run_result_free(&r);

  // The failure and its hint reach the debug log.
  ocrgrab_shutdown_logging();
  std::string log = ocrgrab_test::ReadTextFile(dir_.File("debug.log"));
  EXPECT_NE(log.find("ollama serve"), std::string::npos);
}

TEST_F(RunLinuxTest, DismissedSelectionIsCancel) {
  OcrGrabRunResult r;
  OcrGrabError err = RunWith("true", &r);
  EXPECT_EQ(err, kOcrGrabCancelled);
  EXPECT_EQ(r.state, kOcrGrabStateCancelled);
  EXPECT_EQ(r.image_path, nullptr);
  ASSERT_NE(r.message, nullptr);
  EXPECT_STREQ(r.message, "Screenshot canceled.");
  EXPECT_EQ(ocrgrab_exit_code(err), 0);
  EXPECT_TRUE(ocrgrab_test::TempDir::ListDir(OutDir()).empty());
  ocrgrab_run_result_free(&r);
}

TEST_F(RunLinuxTest, FailingCaptureToolIsUnavailable) {
  OcrGrabRunResult r;
  OcrGrabError err = RunWith("false", &r);
  EXPECT_EQ(err, kOcrGrabErrorCaptureUnavailable);
  EXPECT_EQ(r.failed_in, kOcrGrabStateCapturing);
  EXPECT_EQ(ocrgrab_exit_code(err), 1);
  ocrgrab_run_result_free(&r);
}

TEST_F(RunLinuxTest, MissingCaptureToolIsUnavailable) {
  OcrGrabRunResult r;
  EXPECT_EQ(RunWith("ocrgrab-no-such-screenshot-tool {output}", &r),
            kOcrGrabErrorCaptureUnavailable);
  ASSERT_NE(r.message, nullptr);
  EXPECT_NE(std::string(r.message).find("ocrgrab-no-such-screenshot-tool"),
            std::string::npos);
  ocrgrab_run_result_free(&r);
}

TEST_F(RunLinuxTest, ResultWithoutOutStruct) {
  EXPECT_EQ(RunWith("true", nullptr), kOcrGrabCancelled);
}
