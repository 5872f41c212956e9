#pragma once

#include "crucible/execution/session.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace crucible::execution {

/// Session table. Closed sessions stay listed for inspection until replaced by a
/// new session with the same id.
class SessionManager {
public:
  SessionManager() = default;

  /// Returns the active session with the configured id, or creates one. The bool
  /// is true when a new session was created.
  [[nodiscard]] std::pair<std::shared_ptr<Session>, bool> get_or_create(SessionConfig config);

  /// Removes and returns the session with `id` so it can be torn down.
  std::shared_ptr<Session> take(const std::string &id);

  [[nodiscard]] std::shared_ptr<Session> find(const std::string &id) const;
  [[nodiscard]] std::vector<std::shared_ptr<Session>> all() const;
  [[nodiscard]] std::size_t active_count() const;

  [[nodiscard]] static std::string generate_session_id();

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace crucible::execution
