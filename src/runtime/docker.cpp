#include "crucible/runtime/docker.hpp"

#include "crucible/common/fs.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace crucible::runtime {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void drain(const int fd, std::string &buffer, const OutputCallback &callback) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes <= 0) {
      return;
    }
    const std::string_view piece(chunk.data(), static_cast<std::size_t>(bytes));
    buffer.append(piece);
    if (callback) {
      callback(piece);
    }
  }
}

void close_pipe(int (&fds)[2]) {
  for (int &fd : fds) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

} // namespace

DockerCliRunner::DockerCliRunner(std::string binary) : binary_(std::move(binary)) {}

common::Result<DockerProcessResult>
DockerCliRunner::run(const std::vector<std::string> &args, const DockerCommandOptions &options) {
  using RunResult = common::Result<DockerProcessResult>;
  if (args.empty()) {
    return RunResult::failure(common::ErrorKind::Runtime, "docker command is empty");
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return RunResult::failure(common::ErrorKind::Runtime, "failed to create pipes for docker");
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return RunResult::failure(common::ErrorKind::Runtime, "failed to fork docker process");
  }

  if (pid == 0) {
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      (void)dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);

    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(binary_.c_str()));
    for (const auto &arg : args) {
      argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execvp(binary_.c_str(), argv.data());
    _exit(127);
  }

  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  stdout_pipe[1] = -1;
  stderr_pipe[1] = -1;
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  DockerProcessResult result;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    drain(stdout_pipe[0], result.stdout_text, options.on_stdout);
    drain(stderr_pipe[0], result.stderr_text, options.on_stderr);

    if (waitpid(pid, &status, WNOHANG) == pid) {
      break;
    }

    const bool cancelled =
        options.cancel_requested != nullptr && options.cancel_requested->load();
    const bool expired = std::chrono::steady_clock::now() - started > options.timeout;
    if (cancelled || expired) {
      result.cancelled = cancelled;
      result.timed_out = !cancelled;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  drain(stdout_pipe[0], result.stdout_text, options.on_stdout);
  drain(stderr_pipe[0], result.stderr_text, options.on_stderr);
  close_pipe(stdout_pipe);
  close_pipe(stderr_pipe);

  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (result.timed_out || result.cancelled) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return RunResult::failure(
          result.timed_out ? common::ErrorKind::ExecutionTimeout : common::ErrorKind::Cancelled,
          std::string(result.timed_out ? "docker command timed out: " : "docker command cancelled: ") +
              common::join(args, " "));
    }
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "docker command failed: " + common::join(args, " ")
                                    : common::trim(result.stderr_text);
    return RunResult::failure(common::ErrorKind::Runtime, message);
  }

  return RunResult::success(std::move(result));
}

} // namespace crucible::runtime
