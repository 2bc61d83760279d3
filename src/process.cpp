/**
 * @file process.cpp
 * @brief External tool execution implementation
 *
 * @details Uses posix_spawnp with file actions that attach stdin/stdout to
 *          /dev/null and stderr to a pipe. The parent drains the pipe until
 *          EOF, then reaps the child.
 */

#include "clip_batch/process.hpp"

#include <cerrno>
#include <cstring>
#include <deque>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "clip_batch/logging.hpp"

extern char **environ;

namespace clip_batch {

namespace {

/// Owns a file descriptor for the duration of a spawn
class FdGuard {
public:
  explicit FdGuard(int fd = -1) : fd_(fd) {}
  ~FdGuard() { reset(); }
  FdGuard(const FdGuard &) = delete;
  FdGuard &operator=(const FdGuard &) = delete;

  int get() const { return fd_; }
  void reset() {
    if (fd_ >= 0)
      close(fd_);
    fd_ = -1;
  }

private:
  int fd_;
};

/// Owns posix_spawn_file_actions_t
class SpawnActions {
public:
  SpawnActions() { posix_spawn_file_actions_init(&actions_); }
  ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }
  SpawnActions(const SpawnActions &) = delete;
  SpawnActions &operator=(const SpawnActions &) = delete;

  posix_spawn_file_actions_t *get() { return &actions_; }

private:
  posix_spawn_file_actions_t actions_;
};

ProcessResult launch_failure(const std::string &program, int err) {
  ProcessResult result;
  result.launched = false;
  result.exit_code = 127;
  result.diagnostic_tail =
      fmt::format("failed to launch {}: {}", program, std::strerror(err));
  return result;
}

} // anonymous namespace

std::string tail_lines(const std::string &text, int n) {
  if (n <= 0)
    return {};

  std::deque<std::string> lines;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = text.find_first_of("\r\n", pos);
    if (end == std::string::npos)
      end = text.size();
    if (end > pos) {
      lines.push_back(text.substr(pos, end - pos));
      if (static_cast<int>(lines.size()) > n)
        lines.pop_front();
    }
    pos = end + 1;
  }

  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0)
      out += '\n';
    out += lines[i];
  }
  return out;
}

std::string describe_command(const std::string &program,
                             const std::vector<std::string> &args) {
  std::string cmd = program;
  for (const auto &arg : args) {
    cmd += ' ';
    if (arg.find_first_of(" \t'\"") != std::string::npos) {
      cmd += fmt::format("\"{}\"", arg);
    } else {
      cmd += arg;
    }
  }
  return cmd;
}

ProcessResult run_process(const std::string &program,
                          const std::vector<std::string> &args,
                          int tail_lines_count) {
  int pipe_fds[2];
  if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
    return launch_failure(program, errno);
  }
  FdGuard read_end(pipe_fds[0]);
  FdGuard write_end(pipe_fds[1]);

  /// stdin/stdout to /dev/null keeps ffmpeg from waiting on the terminal
  SpawnActions actions;
  posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO, "/dev/null",
                                   O_WRONLY, 0);
  posix_spawn_file_actions_adddup2(actions.get(), write_end.get(),
                                   STDERR_FILENO);

  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(program.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, program.c_str(), actions.get(), nullptr,
                        argv.data(), environ);
  if (rc != 0) {
    return launch_failure(program, rc);
  }

  /// Parent keeps only the read end so EOF arrives when the child exits
  write_end.reset();

  std::string captured;
  char buffer[4096];
  for (;;) {
    ssize_t n = read(read_end.get(), buffer, sizeof(buffer));
    if (n > 0) {
      captured.append(buffer, static_cast<size_t>(n));
    } else if (n == 0) {
      break;
    } else if (errno != EINTR) {
      LOG_WARN("Reading stderr of {} failed: {}", program,
               std::strerror(errno));
      break;
    }
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return launch_failure(program, errno);
    }
  }

  ProcessResult result;
  result.launched = true;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  result.diagnostic_tail = tail_lines(captured, tail_lines_count);
  return result;
}

} // namespace clip_batch
