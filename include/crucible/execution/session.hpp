#pragma once

#include "crucible/common/cancellation.hpp"
#include "crucible/common/result.hpp"
#include "crucible/config/schema.hpp"
#include "crucible/container/container.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace crucible::execution {

enum class ContainerStrategy { PerExecution, Pool, PerSession };

[[nodiscard]] std::string strategy_to_string(ContainerStrategy strategy);
[[nodiscard]] common::Result<ContainerStrategy> strategy_from_string(const std::string &value);

struct SessionConfig {
  ContainerStrategy strategy = ContainerStrategy::PerExecution;
  /// Replaces the engine's pool bounds when set.
  std::optional<config::PoolConfig> pool_config;
  container::ContainerConfig container;
  /// Generated as `session-<16 hex>` when absent.
  std::optional<std::string> session_id;
  /// Tear down and replace an existing session with the same id.
  bool enforce_new_session = false;
};

struct SessionInfo {
  std::string session_id;
  ContainerStrategy strategy = ContainerStrategy::PerExecution;
  std::chrono::system_clock::time_point created_at;
  std::optional<std::chrono::system_clock::time_point> last_executed_at;
  bool is_active = true;
  std::optional<container::ContainerMeta> current_container;
  std::vector<container::ContainerMeta> container_history;
  std::size_t queue_depth = 0;
};

/// One session: its strategy, the container it currently holds and the FIFO lane
/// that serializes its requests.
class Session {
public:
  Session(std::string id, SessionConfig config);

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] ContainerStrategy strategy() const { return config_.strategy; }
  [[nodiscard]] const SessionConfig &config() const { return config_; }

  /// Waits for this request's turn. Leaves the queue with ErrorKind::Cancelled
  /// when `cancel` fires first and ErrorKind::NotFound when the session closes.
  [[nodiscard]] common::Status enter(const common::CancellationToken &cancel);
  void leave();
  [[nodiscard]] std::size_t queue_depth() const;

  [[nodiscard]] std::shared_ptr<container::ContainerHandle> current_container() const;
  /// Binds `handle` unless the session was closed. Callers own an unbound handle.
  [[nodiscard]] bool bind(std::shared_ptr<container::ContainerHandle> handle);
  /// Drops the current container and appends its final metadata to the history.
  void retire_current();

  void add_workspace(const std::filesystem::path &dir);
  [[nodiscard]] std::vector<std::filesystem::path> workspaces() const;

  void mark_executed();
  [[nodiscard]] bool is_active() const;
  /// Marks the session inactive, wakes queued requests and hands back the bound
  /// container for teardown. Returns nullptr when already closed.
  std::shared_ptr<container::ContainerHandle> close();

  [[nodiscard]] SessionInfo info() const;

private:
  std::string id_;
  SessionConfig config_;
  std::chrono::system_clock::time_point created_at_;

  mutable std::mutex mutex_;
  std::condition_variable lane_cv_;
  std::deque<std::uint64_t> waiting_;
  std::uint64_t next_ticket_ = 0;
  bool busy_ = false;
  bool active_ = true;
  std::optional<std::chrono::system_clock::time_point> last_executed_at_;
  std::shared_ptr<container::ContainerHandle> current_;
  std::vector<container::ContainerMeta> history_;
  std::vector<std::filesystem::path> workspaces_;
};

/// RAII turn in a session lane.
class LaneTurn {
public:
  explicit LaneTurn(Session &session) : session_(&session) {}
  ~LaneTurn() {
    if (session_ != nullptr) {
      session_->leave();
    }
  }

  LaneTurn(const LaneTurn &) = delete;
  LaneTurn &operator=(const LaneTurn &) = delete;

private:
  Session *session_;
};

} // namespace crucible::execution
