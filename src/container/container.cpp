#include "crucible/container/container.hpp"

#include "crucible/observability/global.hpp"

namespace crucible::container {

std::string container_state_to_string(const ContainerState state) {
  switch (state) {
  case ContainerState::Provisioning:
    return "provisioning";
  case ContainerState::Ready:
    return "ready";
  case ContainerState::Executing:
    return "executing";
  case ContainerState::Evicted:
    return "evicted";
  case ContainerState::Released:
    return "released";
  case ContainerState::Destroyed:
    return "destroyed";
  }
  return "destroyed";
}

bool is_terminal_state(const ContainerState state) {
  return state == ContainerState::Evicted || state == ContainerState::Released ||
         state == ContainerState::Destroyed;
}

bool is_valid_transition(const ContainerState from, const ContainerState to) {
  if (is_terminal_state(from)) {
    return false;
  }
  if (to == ContainerState::Destroyed) {
    return true;
  }
  switch (from) {
  case ContainerState::Provisioning:
    return to == ContainerState::Ready;
  case ContainerState::Ready:
    return to == ContainerState::Executing || to == ContainerState::Evicted ||
           to == ContainerState::Released;
  case ContainerState::Executing:
    return to == ContainerState::Ready;
  default:
    return false;
  }
}

ContainerHandle::ContainerHandle(std::string id, std::string name, std::string image,
                                 std::filesystem::path workspace_dir)
    : id_(std::move(id)), name_(std::move(name)), image_(std::move(image)),
      workspace_dir_(std::move(workspace_dir)), created_at_(std::chrono::system_clock::now()),
      idle_since_(std::chrono::steady_clock::now()) {}

ContainerState ContainerHandle::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

common::Status ContainerHandle::transition(const ContainerState to) {
  ContainerState from;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = state_;
    if (!is_valid_transition(from, to)) {
      return common::Status::error(common::ErrorKind::Runtime,
                                   "invalid container transition " +
                                       container_state_to_string(from) + " -> " +
                                       container_state_to_string(to) + " for " + name_);
    }
    state_ = to;
    if (to == ContainerState::Ready) {
      idle_since_ = std::chrono::steady_clock::now();
    }
  }
  observability::record_container_transition(name_, image_, container_state_to_string(from),
                                             container_state_to_string(to));
  return common::Status::success();
}

common::Status ContainerHandle::begin_execution() { return transition(ContainerState::Executing); }

common::Status ContainerHandle::finish_execution() {
  touch();
  return transition(ContainerState::Ready);
}

std::vector<std::string> ContainerHandle::merge_generated_files(const std::vector<std::string> &files) {
  std::lock_guard<std::mutex> lock(mutex_);
  session_generated_files_.insert(files.begin(), files.end());
  return {session_generated_files_.begin(), session_generated_files_.end()};
}

std::vector<std::string> ContainerHandle::session_generated_files() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {session_generated_files_.begin(), session_generated_files_.end()};
}

void ContainerHandle::touch() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_executed_at_ = std::chrono::system_clock::now();
  idle_since_ = std::chrono::steady_clock::now();
  ++execution_count_;
}

std::chrono::steady_clock::time_point ContainerHandle::idle_since() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_since_;
}

ContainerMeta ContainerHandle::meta() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ContainerMeta{
      .container_id = id_,
      .container_name = name_,
      .image_name = image_,
      .created_at = created_at_,
      .last_executed_at = last_executed_at_,
      .is_running = state_ == ContainerState::Ready || state_ == ContainerState::Executing,
      .workspace_dir = workspace_dir_,
      .session_generated_files = {session_generated_files_.begin(), session_generated_files_.end()},
      .state = state_,
      .execution_count = execution_count_,
  };
}

} // namespace crucible::container
