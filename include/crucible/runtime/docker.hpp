#pragma once

#include "crucible/common/result.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace crucible::runtime {

using OutputCallback = std::function<void(std::string_view)>;

struct DockerCommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
  OutputCallback on_stdout;
  OutputCallback on_stderr;
  const std::atomic<bool> *cancel_requested = nullptr;
};

struct DockerProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool cancelled = false;
};

class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  [[nodiscard]] virtual common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;
};

/// Runs the docker CLI as a child process. Output is read through non-blocking
/// pipes and forwarded to the callbacks as it arrives; the child is SIGKILLed on
/// timeout or when `cancel_requested` flips.
class DockerCliRunner final : public IDockerRunner {
public:
  explicit DockerCliRunner(std::string binary = "docker");

  [[nodiscard]] common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;

private:
  std::string binary_;
};

} // namespace crucible::runtime
