#pragma once

#include "crucible/common/result.hpp"
#include "crucible/runtime/docker.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crucible::runtime {

enum class MountType { File, Directory, Zip };

[[nodiscard]] std::string mount_type_to_string(MountType type);

struct Mount {
  MountType type = MountType::Directory;
  std::filesystem::path source;
  std::string target;
  bool read_only = false;
};

using EnvList = std::vector<std::pair<std::string, std::string>>;

struct ResourceLimits {
  std::optional<double> cpus;
  std::optional<std::string> memory;

  [[nodiscard]] bool empty() const { return !cpus.has_value() && !memory.has_value(); }
  bool operator==(const ResourceLimits &) const = default;
};

struct ContainerSpec {
  std::string name;
  std::string image;
  std::vector<Mount> mounts;
  EnvList env;
  std::vector<std::uint16_t> ports;
  std::filesystem::path workspace_dir;
  ResourceLimits limits;
  std::map<std::string, std::string> labels;
};

struct ExecSpec {
  std::vector<std::string> command;
  EnvList env;
  ResourceLimits limits;
  std::chrono::milliseconds timeout{30'000};
  OutputCallback on_stdout;
  OutputCallback on_stderr;
  const std::atomic<bool> *cancel_requested = nullptr;
  /// Defaults to the runtime's workspace directory when empty.
  std::string workdir;
};

struct ExecOutcome {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool cancelled = false;
};

struct ContainerInspection {
  bool exists = false;
  bool running = false;
  std::string image;
};

/// Capability interface over an isolating container engine. Implementations must
/// be safe to call from several threads at once for different containers.
class IContainerRuntime {
public:
  virtual ~IContainerRuntime() = default;

  /// Creates a stopped container and returns its runtime id.
  [[nodiscard]] virtual common::Result<std::string> create(const ContainerSpec &spec) = 0;
  [[nodiscard]] virtual common::Status start(const std::string &container_id) = 0;
  [[nodiscard]] virtual common::Result<ExecOutcome> exec(const std::string &container_id,
                                                         const ExecSpec &spec) = 0;
  [[nodiscard]] virtual common::Status stop(const std::string &container_id) = 0;
  [[nodiscard]] virtual common::Status remove(const std::string &container_id) = 0;
  [[nodiscard]] virtual common::Result<ContainerInspection>
  inspect(const std::string &container_id) = 0;
  [[nodiscard]] virtual common::Status copy_in(const std::string &container_id,
                                               const std::filesystem::path &host_path,
                                               const std::string &container_path) = 0;
  [[nodiscard]] virtual common::Status copy_out(const std::string &container_id,
                                                const std::string &container_path,
                                                const std::filesystem::path &host_path) = 0;

  /// Container-side directory the host workspace is mounted on.
  [[nodiscard]] virtual std::string workspace_mount_point() const = 0;
};

} // namespace crucible::runtime
