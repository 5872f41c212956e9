#include "crucible/execution/session_manager.hpp"

#include "crucible/common/fs.hpp"
#include "crucible/observability/global.hpp"

#include <algorithm>

namespace crucible::execution {

std::string SessionManager::generate_session_id() { return "session-" + common::random_hex(16); }

std::pair<std::shared_ptr<Session>, bool> SessionManager::get_or_create(SessionConfig config) {
  std::string id = config.session_id.has_value() ? common::trim(*config.session_id) : std::string();
  if (id.empty()) {
    id = generate_session_id();
  }

  std::shared_ptr<Session> session;
  bool created = false;
  std::size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end() && it->second->is_active()) {
      return {it->second, false};
    }
    session = std::make_shared<Session>(id, std::move(config));
    sessions_[id] = session;
    created = true;
    for (const auto &[key, entry] : sessions_) {
      active += entry->is_active() ? 1 : 0;
    }
  }
  observability::record_metric(observability::ActiveSessionsMetric{.count = active});
  return {session, created};
}

std::shared_ptr<Session> SessionManager::take(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  auto session = it->second;
  sessions_.erase(it);
  return session;
}

std::shared_ptr<Session> SessionManager::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Session>> SessionManager::all() const {
  std::vector<std::shared_ptr<Session>> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(sessions_.size());
    for (const auto &[id, session] : sessions_) {
      out.push_back(session);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const auto &a, const auto &b) { return a->id() < b->id(); });
  return out;
}

std::size_t SessionManager::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(
      sessions_.begin(), sessions_.end(), [](const auto &entry) { return entry.second->is_active(); }));
}

} // namespace crucible::execution
