#pragma once

#include <atomic>
#include <memory>

namespace crucible::common {

/// Shared cancellation flag. Copies observe the same state.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() { flag_->store(true); }
  [[nodiscard]] bool is_cancelled() const { return flag_->load(); }
  [[nodiscard]] const std::atomic<bool> *flag() const { return flag_.get(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace crucible::common
