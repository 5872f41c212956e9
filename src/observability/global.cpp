#include "crucible/observability/global.hpp"

#include <mutex>

namespace crucible::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_container_transition(const std::string &container, const std::string &image,
                                 const std::string &from_state, const std::string &to_state) {
  record_event(ContainerTransitionEvent{
      .container = container, .image = image, .from_state = from_state, .to_state = to_state});
}

void record_execution_start(const std::string &session_id, const std::string &language,
                            const std::string &strategy) {
  record_event(
      ExecutionStartEvent{.session_id = session_id, .language = language, .strategy = strategy});
}

void record_execution_end(const std::string &session_id, const std::string &language,
                          const std::string &status, const int exit_code,
                          const std::chrono::milliseconds duration) {
  record_event(ExecutionEndEvent{.session_id = session_id,
                                 .language = language,
                                 .status = status,
                                 .exit_code = exit_code,
                                 .duration = duration});
  record_metric(ExecutionLatencyMetric{.latency = duration});
}

void record_protocol_step(const std::string &session_id, const std::string &step,
                          const std::string &detail) {
  record_event(ProtocolStepEvent{.session_id = session_id, .step = step, .detail = detail});
}

void record_pool_eviction(const std::string &pool_key, const std::string &container,
                          const std::chrono::milliseconds idle_for) {
  record_event(PoolEvictionEvent{.pool_key = pool_key, .container = container, .idle_for = idle_for});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace crucible::observability
