#pragma once

#include "crucible/common/result.hpp"
#include "crucible/runtime/container_runtime.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace crucible::container {

enum class ContainerState { Provisioning, Ready, Executing, Evicted, Released, Destroyed };

[[nodiscard]] std::string container_state_to_string(ContainerState state);
[[nodiscard]] bool is_terminal_state(ContainerState state);
[[nodiscard]] bool is_valid_transition(ContainerState from, ContainerState to);

struct ContainerConfig {
  /// Empty means the language's default image.
  std::string image;
  std::vector<runtime::Mount> mounts;
  runtime::EnvList env;
  std::optional<std::string> name;
  std::vector<std::uint16_t> ports;
};

struct ContainerMeta {
  std::string container_id;
  std::string container_name;
  std::string image_name;
  std::chrono::system_clock::time_point created_at;
  std::optional<std::chrono::system_clock::time_point> last_executed_at;
  bool is_running = false;
  std::filesystem::path workspace_dir;
  std::vector<std::string> session_generated_files;
  ContainerState state = ContainerState::Provisioning;
  std::uint64_t execution_count = 0;
};

/// In-process representative of one live container. Metadata and lifecycle state
/// are guarded by the handle's own mutex.
class ContainerHandle {
public:
  ContainerHandle(std::string id, std::string name, std::string image,
                  std::filesystem::path workspace_dir);

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const std::string &image() const { return image_; }
  [[nodiscard]] const std::filesystem::path &workspace_dir() const { return workspace_dir_; }

  [[nodiscard]] ContainerState state() const;
  [[nodiscard]] common::Status transition(ContainerState to);

  /// Ready → Executing. Fails when another request already holds the handle.
  [[nodiscard]] common::Status begin_execution();
  /// Executing → Ready, stamping the execution time.
  [[nodiscard]] common::Status finish_execution();

  /// Adds `files` to the cumulative set and returns the whole set, sorted.
  std::vector<std::string> merge_generated_files(const std::vector<std::string> &files);
  [[nodiscard]] std::vector<std::string> session_generated_files() const;

  void touch();
  [[nodiscard]] std::chrono::steady_clock::time_point idle_since() const;

  [[nodiscard]] ContainerMeta meta() const;

private:
  std::string id_;
  std::string name_;
  std::string image_;
  std::filesystem::path workspace_dir_;
  std::chrono::system_clock::time_point created_at_;

  mutable std::mutex mutex_;
  ContainerState state_ = ContainerState::Provisioning;
  std::optional<std::chrono::system_clock::time_point> last_executed_at_;
  std::chrono::steady_clock::time_point idle_since_;
  std::set<std::string> session_generated_files_;
  std::uint64_t execution_count_ = 0;
};

} // namespace crucible::container
