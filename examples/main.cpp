// Copyright 2026 The ocrgrab Authors
//
// ocrgrab -- capture a screen region and extract its text with a local OCR
// model. One run per invocation; the exit status reports the outcome.

#include <cstdio>
#include <exception>
#include <string>

#include "core/cli_options.h"
#include "ocrgrab/ocrgrab.hpp"

namespace {

int RunOnce(const CliOptions& options) {
  ocrgrab::Context ctx = options.config_path.empty()
                             ? ocrgrab::Context()
                             : ocrgrab::Context(options.config_path);
  if (options.verbose) ocrgrab_set_log_level(kOcrGrabLogDebug);
  if (options.no_editor) ctx.SetOpenEditor(false);

  ocrgrab::RunResult result = ctx.Run(options.mode);
  if (result.ok()) {
    std::printf("[SUCCESS] %s\n", result.message().c_str());
    std::fflush(stdout);
  }
  return ocrgrab_exit_code(result.error());
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions options;
  std::string error;
  if (!ParseCliOptions(argc, argv, &options, &error)) {
    std::fprintf(stderr, "[ERROR] %s\n", error.c_str());
    PrintUsage(stderr, argv[0]);
    return ocrgrab_exit_code(kOcrGrabErrorInvalidParam);
  }
  if (options.show_help) {
    PrintUsage(stdout, argv[0]);
    return 0;
  }
  if (options.show_version) {
    std::printf("ocrgrab %s\n", ocrgrab_version_string());
    return 0;
  }

  int status;
  try {
    status = RunOnce(options);
  } catch (const ocrgrab::Error& e) {
    std::fprintf(stderr, "[ERROR] %s\n", e.what());
    status = ocrgrab_exit_code(e.code());
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[ERROR] Unexpected error: %s\n", e.what());
    status = ocrgrab_exit_code(kOcrGrabErrorUnknown);
  }
  ocrgrab_shutdown_logging();
  return status;
}
