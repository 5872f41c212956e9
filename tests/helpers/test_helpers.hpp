#pragma once

#include "crucible/config/schema.hpp"
#include "crucible/observability/observer.hpp"
#include "crucible/runtime/container_runtime.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace crucible::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read(const std::string &name) const;

private:
  std::filesystem::path path_;
};

/// Engine config rooted in `workspace` with quiet observability, a small pool and
/// no provisioning backoff.
config::Config temp_config(const TempWorkspace &workspace);

/// In-memory container runtime. Containers are entries in a map; `exec` runs a
/// tiny line-based script against the host-side workspace directory:
///
///   print <text>           stdout line
///   stderr <text>          stderr line
///   write <path> <text>    create or replace a workspace file
///   append <path> <text>   append a line to a workspace file
///   cat <path>             workspace file to stdout
///   sleep <ms>             waits, honouring the exec timeout and cancellation
///   exit <code>            stop with that exit code
///
/// The script is the file named by the last command argument. Installer commands
/// (pip, npm, apk) succeed unless a package is literally named "doesnotexist".
/// Anything else exits 0.
class FakeContainerRuntime final : public runtime::IContainerRuntime {
public:
  struct Container {
    std::string name;
    std::string image;
    std::filesystem::path workspace;
    runtime::ResourceLimits limits;
    bool running = false;
  };

  [[nodiscard]] common::Result<std::string> create(const runtime::ContainerSpec &spec) override;
  [[nodiscard]] common::Status start(const std::string &container_id) override;
  [[nodiscard]] common::Result<runtime::ExecOutcome> exec(const std::string &container_id,
                                                          const runtime::ExecSpec &spec) override;
  [[nodiscard]] common::Status stop(const std::string &container_id) override;
  [[nodiscard]] common::Status remove(const std::string &container_id) override;
  [[nodiscard]] common::Result<runtime::ContainerInspection>
  inspect(const std::string &container_id) override;
  [[nodiscard]] common::Status copy_in(const std::string &container_id,
                                       const std::filesystem::path &host_path,
                                       const std::string &container_path) override;
  [[nodiscard]] common::Status copy_out(const std::string &container_id,
                                        const std::string &container_path,
                                        const std::filesystem::path &host_path) override;
  [[nodiscard]] std::string workspace_mount_point() const override { return "/workspace"; }

  /// The next `count` creates fail.
  void fail_next_creates(std::size_t count);

  [[nodiscard]] std::size_t live_count() const;
  [[nodiscard]] std::size_t max_live() const;
  [[nodiscard]] std::size_t created_count() const;
  [[nodiscard]] std::size_t removed_count() const;
  [[nodiscard]] std::size_t max_concurrent_execs() const;
  [[nodiscard]] bool exists(const std::string &container_id) const;
  [[nodiscard]] std::vector<std::vector<std::string>> exec_log() const;
  [[nodiscard]] std::vector<std::string> copy_in_log() const;

private:
  [[nodiscard]] runtime::ExecOutcome run_script(const std::filesystem::path &workspace,
                                                const runtime::ExecSpec &spec) const;
  [[nodiscard]] static runtime::ExecOutcome run_installer(const runtime::ExecSpec &spec);

  mutable std::mutex mutex_;
  std::map<std::string, Container> containers_;
  std::size_t next_id_ = 0;
  std::size_t fail_creates_ = 0;
  std::size_t max_live_ = 0;
  std::size_t created_ = 0;
  std::size_t removed_ = 0;
  std::size_t active_execs_ = 0;
  std::size_t max_active_execs_ = 0;
  std::vector<std::vector<std::string>> exec_log_;
  std::vector<std::string> copy_in_log_;
};

/// Keeps every event and metric. Installed as the global observer for the
/// lifetime of an `ObserverScope`.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  template <typename T> [[nodiscard]] std::vector<T> events_of() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out;
    for (const auto &event : events_) {
      if (const auto *typed = std::get_if<T>(&event)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  template <typename T> [[nodiscard]] std::vector<T> metrics_of() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out;
    for (const auto &metric : metrics_) {
      if (const auto *typed = std::get_if<T>(&metric)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

class ObserverScope {
public:
  ObserverScope();
  ~ObserverScope();

  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_;
};

} // namespace crucible::testing
