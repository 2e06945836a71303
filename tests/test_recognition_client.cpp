// Copyright 2026 The ocrgrab Authors
// Tests for: RecognitionClient (request bodies, failure classification,
//            processor diagnostics) and the libcurl transport

#include <string>

#include "gtest/gtest.h"

#include "core/base64.h"
#include "core/json_util.h"
#include "recognize/curl_recognition_client.h"
#include "fakes.h"
#include "test_util.h"

using ocrgrab::internal::ClassifyCurlResult;
using ocrgrab::internal::HttpResponse;
using ocrgrab::internal::ProcessorPlacement;
using ocrgrab::internal::RecognitionOptions;
using ocrgrab::internal::RecognitionOutcome;
using ocrgrab_test::ConnectRefused;
using ocrgrab_test::Reply;
using ocrgrab_test::ScriptedRecognitionClient;
using ocrgrab_test::TimedOut;

class RecognitionClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    image_ = dir_.File("shot.png");
    ocrgrab_test::WriteTextFile(image_, "foobar");
  }

  ocrgrab_test::TempDir dir_;
  ocrgrab_test::CapturingLogger log_;
  ScriptedRecognitionClient client_{log_.get()};
  std::string image_;
};

// ---------------------------------------------------------------------------
// Model check
// ---------------------------------------------------------------------------

TEST_F(RecognitionClientTest, CheckModelPostsToShow) {
  client_.post_replies.push_back(Reply(200, "{}"));
  RecognitionOutcome out = client_.CheckModel();
  EXPECT_EQ(out.error, kOcrGrabOk);

  ASSERT_EQ(client_.requests.size(), 1u);
  EXPECT_EQ(client_.requests[0].method, "POST");
  EXPECT_EQ(client_.requests[0].url, "http://localhost:11434/api/show");
  EXPECT_EQ(client_.requests[0].body, "{\"model\":\"glm-ocr\"}");
  EXPECT_EQ(client_.requests[0].timeout_seconds,
            ocrgrab::internal::kModelCheckTimeoutSeconds);
}

TEST_F(RecognitionClientTest, CheckModel404IsModelMissing) {
  client_.post_replies.push_back(
      Reply(404, "{\"error\":\"model 'glm-ocr' not found\"}"));
  RecognitionOutcome out = client_.CheckModel();
  EXPECT_EQ(out.error, kOcrGrabErrorModelMissing);
  EXPECT_NE(out.message.find("glm-ocr"), std::string::npos);
}

TEST_F(RecognitionClientTest, NotFoundErrorTextIsModelMissing) {
  client_.post_replies.push_back(
      Reply(500, "{\"error\":\"model Not Found, try pulling it first\"}"));
  EXPECT_EQ(client_.CheckModel().error, kOcrGrabErrorModelMissing);
}

TEST_F(RecognitionClientTest, ConnectFailureIsDaemonUnreachable) {
  client_.post_replies.push_back(ConnectRefused());
  RecognitionOutcome out = client_.CheckModel();
  EXPECT_EQ(out.error, kOcrGrabErrorDaemonUnreachable);
  EXPECT_NE(out.message.find("http://localhost:11434"), std::string::npos);
}

TEST_F(RecognitionClientTest, ServerErrorIsRecognitionFailed) {
  client_.post_replies.push_back(Reply(500, "{\"error\":\"out of memory\"}"));
  RecognitionOutcome out = client_.CheckModel();
  EXPECT_EQ(out.error, kOcrGrabErrorRecognitionFailed);
  EXPECT_NE(out.message.find("500"), std::string::npos);
  EXPECT_NE(out.message.find("out of memory"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Generate
// ---------------------------------------------------------------------------

TEST_F(RecognitionClientTest, GenerateBodyCarriesModePromptAndImage) {
  std::string body = client_.BuildGenerateBody("Zm9vYmFy", kOcrGrabModeTable);
  std::string value;
  ASSERT_TRUE(ocrgrab::internal::JsonGetString(body, "model", &value));
  EXPECT_EQ(value, "glm-ocr");
  ASSERT_TRUE(ocrgrab::internal::JsonGetString(body, "prompt", &value));
  EXPECT_EQ(value, "Table Recognition:");
  EXPECT_NE(body.find("\"images\":[\"Zm9vYmFy\"]"), std::string::npos);
  EXPECT_NE(body.find("\"stream\":false"), std::string::npos);
}

TEST_F(RecognitionClientTest, RecognizeSendsFileBytesOnce) {
  client_.post_replies.push_back(
      ocrgrab_test::GenerateReply("Hello\\nWorld"));
  RecognitionOutcome out = client_.Recognize(image_, kOcrGrabModeText);
  ASSERT_EQ(out.error, kOcrGrabOk) << out.message;
  EXPECT_EQ(out.text, "Hello\nWorld");

  ASSERT_EQ(client_.requests.size(), 1u);
  EXPECT_EQ(client_.requests[0].url, "http://localhost:11434/api/generate");
  EXPECT_EQ(client_.requests[0].timeout_seconds, 180);
  EXPECT_EQ(client_.requests[0].body,
            client_.BuildGenerateBody("Zm9vYmFy", kOcrGrabModeText));
}

TEST_F(RecognitionClientTest, RecognizeUsesConfiguredTimeout) {
  RecognitionOptions options;
  options.daemon_url = "http://gpu-box:11434";
  options.model = "other-ocr";
  options.timeout_seconds = 42;
  ScriptedRecognitionClient client(log_.get(), options);
  client.post_replies.push_back(ocrgrab_test::GenerateReply("x"));

  EXPECT_EQ(client.Recognize(image_, kOcrGrabModeFigure).error, kOcrGrabOk);
  ASSERT_EQ(client.requests.size(), 1u);
  EXPECT_EQ(client.requests[0].url, "http://gpu-box:11434/api/generate");
  EXPECT_EQ(client.requests[0].timeout_seconds, 42);
  EXPECT_NE(client.requests[0].body.find("\"other-ocr\""), std::string::npos);
}

TEST_F(RecognitionClientTest, TimeoutIsRecognitionFailedWithoutRetry) {
  client_.post_replies.push_back(TimedOut());
  client_.post_replies.push_back(ocrgrab_test::GenerateReply("late"));
  RecognitionOutcome out = client_.Recognize(image_, kOcrGrabModeText);
  EXPECT_EQ(out.error, kOcrGrabErrorRecognitionFailed);
  EXPECT_NE(out.message.find("timed out"), std::string::npos);
  EXPECT_EQ(client_.requests.size(), 1u);
}

TEST_F(RecognitionClientTest, ErrorFieldWithStatus200IsFailure) {
  client_.post_replies.push_back(
      Reply(200, "{\"error\":\"image could not be decoded\"}"));
  RecognitionOutcome out = client_.Recognize(image_, kOcrGrabModeText);
  EXPECT_EQ(out.error, kOcrGrabErrorRecognitionFailed);
  EXPECT_NE(out.message.find("could not be decoded"), std::string::npos);
}

TEST_F(RecognitionClientTest, MissingResponseFieldIsFailure) {
  client_.post_replies.push_back(Reply(200, "{\"done\":true}"));
  EXPECT_EQ(client_.Recognize(image_, kOcrGrabModeText).error,
            kOcrGrabErrorRecognitionFailed);
}

TEST_F(RecognitionClientTest, EmptyResponseIsPassedThrough) {
  client_.post_replies.push_back(ocrgrab_test::GenerateReply(""));
  RecognitionOutcome out = client_.Recognize(image_, kOcrGrabModeText);
  EXPECT_EQ(out.error, kOcrGrabOk);
  EXPECT_EQ(out.text, "");
}

TEST_F(RecognitionClientTest, UnreadableImageFailsWithoutRequest) {
  RecognitionOutcome out =
      client_.Recognize(dir_.File("missing.png"), kOcrGrabModeText);
  EXPECT_EQ(out.error, kOcrGrabErrorRecognitionFailed);
  EXPECT_TRUE(client_.requests.empty());
}

// ---------------------------------------------------------------------------
// Processor diagnostics
// ---------------------------------------------------------------------------

TEST_F(RecognitionClientTest, ProcessorGpu) {
  client_.get_reply = Reply(
      200,
      "{\"models\":[{\"name\":\"llava:7b\",\"size\":10,\"size_vram\":0},"
      "{\"name\":\"glm-ocr:latest\",\"model\":\"glm-ocr:latest\","
      "\"size\":2000,\"size_vram\":2000}]}");
  EXPECT_EQ(client_.DetectProcessor(), ProcessorPlacement::kGpu);
  ASSERT_EQ(client_.requests.size(), 1u);
  EXPECT_EQ(client_.requests[0].method, "GET");
  EXPECT_EQ(client_.requests[0].url, "http://localhost:11434/api/ps");
  EXPECT_EQ(client_.requests[0].timeout_seconds,
            ocrgrab::internal::kDiagnosticsTimeoutSeconds);
  EXPECT_TRUE(log_.Contains("info", "GPU"));
}

TEST_F(RecognitionClientTest, ProcessorCpuWarnsWithHint) {
  client_.get_reply = Reply(
      200, "{\"models\":[{\"name\":\"glm-ocr\",\"size\":2000,\"size_vram\":0}]}");
  EXPECT_EQ(client_.DetectProcessor(), ProcessorPlacement::kCpu);
  EXPECT_TRUE(log_.Contains("warning", "CPU"));
  EXPECT_TRUE(log_.Contains("warning", "ollama serve"));
}

TEST_F(RecognitionClientTest, ProcessorSplitReportsPercentages) {
  client_.get_reply = Reply(
      200,
      "{\"models\":[{\"name\":\"glm-ocr:latest\",\"size\":1000,"
      "\"size_vram\":250}]}");
  EXPECT_EQ(client_.DetectProcessor(), ProcessorPlacement::kSplit);
  EXPECT_TRUE(log_.Contains("warning", "25% GPU / 75% CPU"));
}

TEST_F(RecognitionClientTest, ProcessorUnknownWhenModelNotLoaded) {
  client_.get_reply = Reply(
      200, "{\"models\":[{\"name\":\"glm-ocr-large\",\"size\":1,"
           "\"size_vram\":1}]}");
  EXPECT_EQ(client_.DetectProcessor(), ProcessorPlacement::kUnknown);
}

TEST_F(RecognitionClientTest, ProcessorUnknownOnTransportFailure) {
  client_.get_reply = ConnectRefused();
  EXPECT_EQ(client_.DetectProcessor(), ProcessorPlacement::kUnknown);
  EXPECT_FALSE(log_.HasLevel("error"));
}

// ---------------------------------------------------------------------------
// libcurl transport
// ---------------------------------------------------------------------------

TEST(CurlRecognitionClientTest, ClosedPortIsDaemonUnreachable) {
  ocrgrab_test::CapturingLogger log;
  RecognitionOptions options;
  options.daemon_url = "http://127.0.0.1:1";
  auto client = ocrgrab::internal::CreateRecognitionClient(options, log.get());
  RecognitionOutcome out = client->CheckModel();
  EXPECT_EQ(out.error, kOcrGrabErrorDaemonUnreachable) << out.message;
  EXPECT_EQ(client->DetectProcessor(), ProcessorPlacement::kUnknown);
}

TEST(CurlRecognitionClientTest, TimeoutBeforeConnectIsConnectFailure) {
  EXPECT_EQ(ClassifyCurlResult(CURLE_OPERATION_TIMEDOUT, false),
            HttpResponse::Transport::kConnectFailed);
  EXPECT_EQ(ClassifyCurlResult(CURLE_OPERATION_TIMEDOUT, true),
            HttpResponse::Transport::kTimedOut);
}

TEST(CurlRecognitionClientTest, ResultMapping) {
  EXPECT_EQ(ClassifyCurlResult(CURLE_OK, true), HttpResponse::Transport::kOk);
  EXPECT_EQ(ClassifyCurlResult(CURLE_COULDNT_CONNECT, false),
            HttpResponse::Transport::kConnectFailed);
  EXPECT_EQ(ClassifyCurlResult(CURLE_COULDNT_RESOLVE_HOST, false),
            HttpResponse::Transport::kConnectFailed);
  EXPECT_EQ(ClassifyCurlResult(CURLE_COULDNT_RESOLVE_PROXY, false),
            HttpResponse::Transport::kConnectFailed);
  EXPECT_EQ(ClassifyCurlResult(CURLE_RECV_ERROR, true),
            HttpResponse::Transport::kOtherError);
}

TEST_F(RecognitionClientTest, ConnectTimeoutReportsDaemonUnreachable) {
  HttpResponse stalled;
  stalled.transport =
      ClassifyCurlResult(CURLE_OPERATION_TIMEDOUT, /*connected=*/false);
  stalled.detail = "Connection timed out after 5001 milliseconds";
  client_.post_replies.push_back(stalled);

  RecognitionOutcome out = client_.CheckModel();
  EXPECT_EQ(out.error, kOcrGrabErrorDaemonUnreachable);
  EXPECT_NE(out.message.find("Connection timed out"), std::string::npos);
}
