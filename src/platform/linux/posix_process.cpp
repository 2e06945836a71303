// Copyright 2026 The ocrgrab Authors

#include "platform/linux/posix_process.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>

namespace ocrgrab {
namespace internal {

namespace {

bool IsExecutableFile(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
         ::access(path.c_str(), X_OK) == 0;
}

std::vector<char*> ToArgv(const std::vector<std::string>& args) {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);
  return argv;
}

void RedirectToDevNull(int target_fd, int flags) {
  int fd = ::open("/dev/null", flags);
  if (fd >= 0) {
    ::dup2(fd, target_fd);
    if (fd != target_fd) ::close(fd);
  }
}

bool WriteAll(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t n = ::write(fd, data, size);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
  return true;
}

// Child side: exec `path`, reporting errno through `error_fd` on failure.
[[noreturn]] void ExecOrReport(const std::string& path, char* const argv[],
                               int error_fd) {
  ::execv(path.c_str(), argv);
  int err = errno;
  if (error_fd >= 0) {
    ssize_t ignored = ::write(error_fd, &err, sizeof(err));
    (void)ignored;
  }
  ::_exit(127);
}

// Parent side: read an errno reported by ExecOrReport. 0 means exec worked
// (the CLOEXEC pipe closed without data).
int ReadExecError(int fd) {
  int err = 0;
  ssize_t n;
  do {
    n = ::read(fd, &err, sizeof(err));
  } while (n < 0 && errno == EINTR);
  return n == static_cast<ssize_t>(sizeof(err)) ? err : 0;
}

}  // namespace

std::string FindExecutable(const std::string& name) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) {
    return IsExecutableFile(name) ? name : std::string();
  }
  const char* path_env = std::getenv("PATH");
  std::string path_list = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= path_list.size()) {
    size_t end = path_list.find(':', start);
    if (end == std::string::npos) end = path_list.size();
    std::string dir = path_list.substr(start, end - start);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (IsExecutableFile(candidate)) return candidate;
    start = end + 1;
  }
  return {};
}

std::vector<std::string> SplitCommandLine(const std::string& command) {
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  char quote = 0;
  for (size_t i = 0; i < command.size(); ++i) {
    char c = command[i];
    if (quote) {
      if (c == quote) {
        quote = 0;
      } else if (c == '\\' && quote == '"' && i + 1 < command.size()) {
        current += command[++i];
      } else {
        current += c;
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
      in_word = true;
    } else if (c == '\\' && i + 1 < command.size()) {
      current += command[++i];
      in_word = true;
    } else if (c == ' ' || c == '\t' || c == '\n') {
      if (in_word) {
        words.push_back(current);
        current.clear();
        in_word = false;
      }
    } else {
      current += c;
      in_word = true;
    }
  }
  if (in_word) words.push_back(current);
  return words;
}

ProcessResult RunProcess(const std::vector<std::string>& args,
                         const std::string* stdin_data, bool capture_stderr) {
  ProcessResult result;
  if (args.empty()) {
    result.error = "empty command";
    return result;
  }
  std::string path = FindExecutable(args[0]);
  if (path.empty()) {
    result.error = args[0] + " not found";
    return result;
  }

  int in_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  auto close_all = [&] {
    for (int fd : {in_pipe[0], in_pipe[1], err_pipe[0], err_pipe[1],
                   exec_pipe[0], exec_pipe[1]}) {
      if (fd >= 0) ::close(fd);
    }
  };
  if ((stdin_data && ::pipe(in_pipe) != 0) ||
      (capture_stderr && ::pipe(err_pipe) != 0) ||
      ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    result.error = std::string("pipe failed: ") + std::strerror(errno);
    close_all();
    return result;
  }

  std::vector<char*> argv = ToArgv(args);
  pid_t pid = ::fork();
  if (pid < 0) {
    result.error = std::string("fork failed: ") + std::strerror(errno);
    close_all();
    return result;
  }

  if (pid == 0) {
    if (stdin_data) {
      ::dup2(in_pipe[0], STDIN_FILENO);
    } else {
      RedirectToDevNull(STDIN_FILENO, O_RDONLY);
    }
    RedirectToDevNull(STDOUT_FILENO, O_WRONLY);
    if (capture_stderr) {
      ::dup2(err_pipe[1], STDERR_FILENO);
    } else {
      RedirectToDevNull(STDERR_FILENO, O_WRONLY);
    }
    for (int fd : {in_pipe[0], in_pipe[1], err_pipe[0], err_pipe[1],
                   exec_pipe[0]}) {
      if (fd >= 0) ::close(fd);
    }
    ExecOrReport(path, argv.data(), exec_pipe[1]);
  }

  // Parent.
  ::close(exec_pipe[1]);
  exec_pipe[1] = -1;
  if (in_pipe[0] >= 0) {
    ::close(in_pipe[0]);
    in_pipe[0] = -1;
  }
  if (err_pipe[1] >= 0) {
    ::close(err_pipe[1]);
    err_pipe[1] = -1;
  }

  int exec_error = ReadExecError(exec_pipe[0]);

  if (stdin_data && in_pipe[1] >= 0) {
    // A child that exits early must not kill us with SIGPIPE.
    struct sigaction ignore = {};
    struct sigaction previous = {};
    ignore.sa_handler = SIG_IGN;
    ::sigaction(SIGPIPE, &ignore, &previous);
    if (exec_error == 0) WriteAll(in_pipe[1], stdin_data->data(), stdin_data->size());
    ::close(in_pipe[1]);
    in_pipe[1] = -1;
    ::sigaction(SIGPIPE, &previous, nullptr);
  }

  if (err_pipe[0] >= 0) {
    char buf[4096];
    ssize_t n;
    while ((n = ::read(err_pipe[0], buf, sizeof(buf))) != 0) {
      if (n < 0) {
        if (errno == EINTR) continue;
        break;
      }
      result.stderr_output.append(buf, static_cast<size_t>(n));
    }
  }

  int status = 0;
  pid_t waited;
  do {
    waited = ::waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  close_all();

  if (exec_error != 0) {
    result.error = "cannot execute " + path + ": " + std::strerror(exec_error);
    return result;
  }
  result.started = true;
  if (waited < 0) {
    result.error = std::string("waitpid failed: ") + std::strerror(errno);
    return result;
  }
  if (WIFEXITED(status)) {
    result.exited = true;
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

bool SpawnDetached(const std::vector<std::string>& args, std::string* error) {
  if (args.empty()) {
    if (error) *error = "empty command";
    return false;
  }
  std::string path = FindExecutable(args[0]);
  if (path.empty()) {
    if (error) *error = args[0] + " not found";
    return false;
  }

  int exec_pipe[2];
  if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    if (error) *error = std::string("pipe failed: ") + std::strerror(errno);
    return false;
  }

  std::vector<char*> argv = ToArgv(args);
  pid_t pid = ::fork();
  if (pid < 0) {
    if (error) *error = std::string("fork failed: ") + std::strerror(errno);
    ::close(exec_pipe[0]);
    ::close(exec_pipe[1]);
    return false;
  }

  if (pid == 0) {
    // Intermediate child: new session, then fork the real child so it is
    // reparented to init and never becomes our zombie.
    ::close(exec_pipe[0]);
    ::setsid();
    pid_t grandchild = ::fork();
    if (grandchild < 0) {
      int err = errno;
      ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
      (void)ignored;
      ::_exit(1);
    }
    if (grandchild > 0) ::_exit(0);

    RedirectToDevNull(STDIN_FILENO, O_RDONLY);
    RedirectToDevNull(STDOUT_FILENO, O_WRONLY);
    RedirectToDevNull(STDERR_FILENO, O_WRONLY);
    ExecOrReport(path, argv.data(), exec_pipe[1]);
  }

  ::close(exec_pipe[1]);
  int exec_error = ReadExecError(exec_pipe[0]);
  ::close(exec_pipe[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }

  if (exec_error != 0) {
    if (error) *error = "cannot execute " + path + ": " + std::strerror(exec_error);
    return false;
  }
  return true;
}

}  // namespace internal
}  // namespace ocrgrab
