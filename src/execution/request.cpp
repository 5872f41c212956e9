#include "crucible/execution/request.hpp"

namespace crucible::execution {

std::string execution_status_to_string(const ExecutionStatus status) {
  switch (status) {
  case ExecutionStatus::Completed:
    return "completed";
  case ExecutionStatus::DependencyInstallFailed:
    return "dependency_install_failed";
  case ExecutionStatus::TimedOut:
    return "timed_out";
  case ExecutionStatus::Cancelled:
    return "cancelled";
  }
  return "completed";
}

std::string workspace_sharing_to_string(const WorkspaceSharing sharing) {
  return sharing == WorkspaceSharing::Shared ? "shared" : "isolated";
}

} // namespace crucible::execution
