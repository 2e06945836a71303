// Copyright 2026 The ocrgrab Authors

#include "core/cli_options.h"

#include <cstring>

namespace {

bool StartsWith(const std::string& s, const char* prefix) {
  return s.compare(0, std::strlen(prefix), prefix) == 0;
}

}  // namespace

bool ParseCliOptions(int argc, const char* const* argv, CliOptions* options,
                     std::string* error) {
  bool have_mode = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i] ? argv[i] : "";

    if (arg == "-h" || arg == "--help") {
      options->show_help = true;
    } else if (arg == "--version") {
      options->show_version = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options->verbose = true;
    } else if (arg == "--no-editor") {
      options->no_editor = true;
    } else if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc || !argv[i + 1] || !argv[i + 1][0]) {
        *error = arg + " requires a file argument";
        return false;
      }
      options->config_path = argv[++i];
    } else if (StartsWith(arg, "--config=")) {
      options->config_path = arg.substr(std::strlen("--config="));
      if (options->config_path.empty()) {
        *error = "--config requires a file argument";
        return false;
      }
    } else {
      OcrGrabMode mode;
      if (ocrgrab_mode_parse(arg.c_str(), &mode) != kOcrGrabOk) {
        *error = StartsWith(arg, "-") ? "Unknown option: " + arg
                                      : "Unknown recognition mode: " + arg;
        return false;
      }
      if (have_mode) {
        *error = "Only one recognition mode may be given (got '" + arg + "')";
        return false;
      }
      options->mode = mode;
      have_mode = true;
    }
  }
  return true;
}

void PrintUsage(std::FILE* out, const char* program) {
  std::fprintf(out,
               "Usage: %s [text|table|figure] [options]\n"
               "\n"
               "Select a screen region, recognize it with the local OCR model\n"
               "and save the result next to the screenshot.\n"
               "\n"
               "Options:\n"
               "  -c, --config FILE  Read settings from FILE\n"
               "  -v, --verbose      Log debug details\n"
               "      --no-editor    Do not open the result in an editor\n"
               "      --version      Print the version and exit\n"
               "  -h, --help         Show this help and exit\n"
               "\n"
               "Exit status: 0 success or cancelled, 1 capture unavailable,\n"
               "2 daemon unreachable, 3 no text, 4 model missing,\n"
               "5 write error, 6 recognition failed, 64 usage error.\n",
               program ? program : "ocrgrab");
}
