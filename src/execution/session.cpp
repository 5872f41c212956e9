#include "crucible/execution/session.hpp"

#include "crucible/common/fs.hpp"
#include "crucible/observability/global.hpp"

#include <algorithm>

namespace crucible::execution {

namespace {

constexpr std::chrono::milliseconds LANE_POLL{50};

void report_queue_depth(const std::string &session_id, const std::size_t depth) {
  observability::record_metric(
      observability::QueueDepthMetric{.session_id = session_id, .depth = depth});
}

} // namespace

std::string strategy_to_string(const ContainerStrategy strategy) {
  switch (strategy) {
  case ContainerStrategy::PerExecution:
    return "per_execution";
  case ContainerStrategy::Pool:
    return "pool";
  case ContainerStrategy::PerSession:
    return "per_session";
  }
  return "per_execution";
}

common::Result<ContainerStrategy> strategy_from_string(const std::string &value) {
  std::string normalized = common::to_lower(common::trim(value));
  std::replace(normalized.begin(), normalized.end(), '-', '_');
  if (normalized == "per_execution") {
    return common::Result<ContainerStrategy>::success(ContainerStrategy::PerExecution);
  }
  if (normalized == "pool") {
    return common::Result<ContainerStrategy>::success(ContainerStrategy::Pool);
  }
  if (normalized == "per_session") {
    return common::Result<ContainerStrategy>::success(ContainerStrategy::PerSession);
  }
  return common::Result<ContainerStrategy>::failure(common::ErrorKind::Configuration,
                                                    "unknown container strategy: " + value);
}

Session::Session(std::string id, SessionConfig config)
    : id_(std::move(id)), config_(std::move(config)),
      created_at_(std::chrono::system_clock::now()) {
  config_.session_id = id_;
}

common::Status Session::enter(const common::CancellationToken &cancel) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!active_) {
    return common::Status::error(common::ErrorKind::NotFound, "session is closed: " + id_);
  }

  const std::uint64_t ticket = next_ticket_++;
  waiting_.push_back(ticket);
  const std::size_t depth = waiting_.size() + (busy_ ? 1 : 0);
  lock.unlock();
  report_queue_depth(id_, depth);
  lock.lock();

  const auto leave_queue = [&]() {
    waiting_.erase(std::remove(waiting_.begin(), waiting_.end(), ticket), waiting_.end());
    lane_cv_.notify_all();
  };

  while (true) {
    if (!active_) {
      leave_queue();
      return common::Status::error(common::ErrorKind::NotFound, "session is closed: " + id_);
    }
    if (cancel.is_cancelled()) {
      leave_queue();
      return common::Status::error(common::ErrorKind::Cancelled,
                                   "request cancelled while queued on session " + id_);
    }
    if (!busy_ && !waiting_.empty() && waiting_.front() == ticket) {
      waiting_.pop_front();
      busy_ = true;
      return common::Status::success();
    }
    lane_cv_.wait_for(lock, LANE_POLL);
  }
}

void Session::leave() {
  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    busy_ = false;
    depth = waiting_.size();
  }
  lane_cv_.notify_all();
  report_queue_depth(id_, depth);
}

std::size_t Session::queue_depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return waiting_.size();
}

std::shared_ptr<container::ContainerHandle> Session::current_container() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

bool Session::bind(std::shared_ptr<container::ContainerHandle> handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!active_) {
    return false;
  }
  current_ = std::move(handle);
  return true;
}

void Session::retire_current() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_) {
    history_.push_back(current_->meta());
    current_.reset();
  }
}

void Session::add_workspace(const std::filesystem::path &dir) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(workspaces_.begin(), workspaces_.end(), dir) == workspaces_.end()) {
    workspaces_.push_back(dir);
  }
}

std::vector<std::filesystem::path> Session::workspaces() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return workspaces_;
}

void Session::mark_executed() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_executed_at_ = std::chrono::system_clock::now();
}

bool Session::is_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

std::shared_ptr<container::ContainerHandle> Session::close() {
  std::shared_ptr<container::ContainerHandle> bound;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
      return nullptr;
    }
    active_ = false;
    bound = current_;
  }
  lane_cv_.notify_all();
  return bound;
}

SessionInfo Session::info() const {
  std::lock_guard<std::mutex> lock(mutex_);
  SessionInfo info{
      .session_id = id_,
      .strategy = config_.strategy,
      .created_at = created_at_,
      .last_executed_at = last_executed_at_,
      .is_active = active_,
      .current_container = std::nullopt,
      .container_history = history_,
      .queue_depth = waiting_.size(),
  };
  if (current_) {
    info.current_container = current_->meta();
  }
  return info;
}

} // namespace crucible::execution
