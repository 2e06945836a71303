// Copyright 2026 The ocrgrab Authors
//
// Minimal child-process helpers for the external Linux desktop tools.

#ifndef OCRGRAB_PLATFORM_LINUX_POSIX_PROCESS_H_
#define OCRGRAB_PLATFORM_LINUX_POSIX_PROCESS_H_

#include <string>
#include <vector>

namespace ocrgrab {
namespace internal {

struct ProcessResult {
  bool started = false;    ///< fork/exec succeeded
  bool exited = false;     ///< Terminated normally (not by a signal)
  int exit_code = -1;      ///< Valid when `exited`
  int term_signal = 0;     ///< Terminating signal when !exited
  std::string error;       ///< Why the process could not be started
  std::string stderr_output;  ///< Only when requested
};

/// Resolve `name` against $PATH (names containing '/' are checked as-is).
/// Returns the full path, or "" if no executable is found.
std::string FindExecutable(const std::string& name);

/// Split a command template into argv. Whitespace separates words; single
/// and double quotes group, backslash escapes the next character.
std::vector<std::string> SplitCommandLine(const std::string& command);

/// Run argv[0] (looked up on $PATH) and wait for it. `stdin_data`, when not
/// null, is written to the child's stdin, which is then closed. Child stdout
/// goes to /dev/null. Stderr is captured only when `capture_stderr` is set;
/// leave it off for tools that fork background daemons holding the pipe.
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const std::string* stdin_data, bool capture_stderr);

/// Start argv[0] fully detached (new session, reparented to init) and return
/// without waiting. Returns false with `error` set if exec failed.
bool SpawnDetached(const std::vector<std::string>& argv, std::string* error);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_PLATFORM_LINUX_POSIX_PROCESS_H_
