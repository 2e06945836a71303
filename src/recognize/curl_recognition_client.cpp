// Copyright 2026 The ocrgrab Authors
//
// Recognition client transport using libcurl.

#include "recognize/curl_recognition_client.h"

#include <mutex>
#include <utility>

#include "core/logger.h"

namespace ocrgrab {
namespace internal {

namespace {

size_t CurlWriteCallback(char* ptr, size_t size, size_t nmemb,
                         void* userdata) {
  auto* result = static_cast<std::string*>(userdata);
  size_t total = size * nmemb;
  result->append(ptr, total);
  return total;
}

void EnsureCurlGlobalInit() {
  static std::once_flag flag;
  std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

HttpResponse::Transport ClassifyCurlResult(CURLcode code, bool connected) {
  switch (code) {
    case CURLE_OK:
      return HttpResponse::Transport::kOk;
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
      return HttpResponse::Transport::kConnectFailed;
    case CURLE_OPERATION_TIMEDOUT:
      return connected ? HttpResponse::Transport::kTimedOut
                       : HttpResponse::Transport::kConnectFailed;
    default:
      return HttpResponse::Transport::kOtherError;
  }
}

class CurlRecognitionClient : public RecognitionClient {
 public:
  CurlRecognitionClient(RecognitionOptions options,
                        std::shared_ptr<spdlog::logger> logger)
      : RecognitionClient(std::move(options), std::move(logger)) {
    EnsureCurlGlobalInit();
  }

 protected:
  HttpResponse HttpPost(const std::string& url, const std::string& body,
                        int timeout_seconds) override {
    return Perform(url, &body, timeout_seconds);
  }

  HttpResponse HttpGet(const std::string& url, int timeout_seconds) override {
    return Perform(url, nullptr, timeout_seconds);
  }

 private:
  HttpResponse Perform(const std::string& url, const std::string* post_body,
                       int timeout_seconds) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
      response.detail = "curl_easy_init failed";
      return response;
    }

    char error_buffer[CURL_ERROR_SIZE] = {};
    struct curl_slist* headers = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "ocrgrab/" OCRGRAB_VERSION_STRING);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(kConnectTimeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // The daemon is local; a desktop proxy setting must not intercept it.
    curl_easy_setopt(curl, CURLOPT_NOPROXY, "localhost,127.0.0.1,::1");

    if (post_body) {
      headers = curl_slist_append(headers, "Content-Type: application/json");
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->data());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                       static_cast<curl_off_t>(post_body->size()));
    }

    CURLcode res = curl_easy_perform(curl);
    double connect_time = 0.0;
    curl_easy_getinfo(curl, CURLINFO_CONNECT_TIME, &connect_time);
    response.transport = ClassifyCurlResult(res, connect_time > 0.0);
    if (res == CURLE_OK) {
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    } else {
      response.detail =
          error_buffer[0] ? error_buffer : curl_easy_strerror(res);
      SPDLOG_LOGGER_DEBUG(logger_, "curl {} failed: {} ({})", url,
                          response.detail, static_cast<int>(res));
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
  }
};

std::unique_ptr<RecognitionClient> CreateRecognitionClient(
    RecognitionOptions options, std::shared_ptr<spdlog::logger> logger) {
  return std::make_unique<CurlRecognitionClient>(std::move(options),
                                                 std::move(logger));
}

}  // namespace internal
}  // namespace ocrgrab
