// Copyright 2026 The ocrgrab Authors
//
// Command-line parsing for the ocrgrab executable.

#ifndef OCRGRAB_EXAMPLES_CORE_CLI_OPTIONS_H_
#define OCRGRAB_EXAMPLES_CORE_CLI_OPTIONS_H_

#include <cstdio>
#include <string>

#include "ocrgrab/ocrgrab.h"

struct CliOptions {
  OcrGrabMode mode = kOcrGrabModeText;
  std::string config_path;  // empty: default settings file
  bool verbose = false;
  bool no_editor = false;
  bool show_version = false;
  bool show_help = false;
};

/// Parse argv. The first positional argument selects the mode (matched as in
/// ocrgrab_mode_parse); unknown "--" words are tried as a mode as well, so
/// "--table" works. Returns false with `error` set on a usage error.
bool ParseCliOptions(int argc, const char* const* argv, CliOptions* options,
                     std::string* error);

void PrintUsage(std::FILE* out, const char* program);

#endif  // OCRGRAB_EXAMPLES_CORE_CLI_OPTIONS_H_
