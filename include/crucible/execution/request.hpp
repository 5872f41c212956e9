#pragma once

#include "crucible/runtime/container_runtime.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace crucible::execution {

/// Exit code reported when the main run was killed for exceeding its timeout.
constexpr int TIMEOUT_EXIT_CODE = 124;
/// Exit code reported for a request cancelled before or during its main run.
constexpr int CANCELLED_EXIT_CODE = 130;

struct InlineCode {
  std::string code;
};

/// Runs an existing application. `entry_file` is resolved relative to `cwd`.
struct RunApp {
  std::filesystem::path cwd;
  std::string entry_file;
};

using ExecutionSource = std::variant<InlineCode, RunApp>;

class IOutputSink {
public:
  virtual ~IOutputSink() = default;

  virtual void write(std::string_view chunk) = 0;
};

class CallbackSink final : public IOutputSink {
public:
  explicit CallbackSink(std::function<void(std::string_view)> callback)
      : callback_(std::move(callback)) {}

  void write(std::string_view chunk) override {
    if (callback_) {
      callback_(chunk);
    }
  }

private:
  std::function<void(std::string_view)> callback_;
};

struct StreamSinks {
  std::shared_ptr<IOutputSink> stdout_sink;
  std::shared_ptr<IOutputSink> stderr_sink;
  std::shared_ptr<IOutputSink> dependency_stdout_sink;
  std::shared_ptr<IOutputSink> dependency_stderr_sink;
};

enum class WorkspaceSharing { Isolated, Shared };

struct ExecutionRequest {
  std::string language;
  ExecutionSource source = InlineCode{};
  std::vector<std::string> dependencies;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<double> cpu_limit;
  std::optional<std::string> memory_limit;
  StreamSinks streams;
  WorkspaceSharing workspace_sharing = WorkspaceSharing::Isolated;
  runtime::EnvList env;
  bool verbose = false;
};

enum class ExecutionStatus { Completed, DependencyInstallFailed, TimedOut, Cancelled };

[[nodiscard]] std::string execution_status_to_string(ExecutionStatus status);
[[nodiscard]] std::string workspace_sharing_to_string(WorkspaceSharing sharing);

struct ExecutionResult {
  std::string stdout_text;
  std::string stderr_text;
  std::string dependency_stdout;
  std::string dependency_stderr;
  int exit_code = 0;
  std::chrono::milliseconds execution_time{0};
  std::filesystem::path workspace_dir;
  std::vector<std::string> generated_files;
  std::vector<std::string> session_generated_files;
  ExecutionStatus status = ExecutionStatus::Completed;
  std::string container_id;
};

} // namespace crucible::execution
