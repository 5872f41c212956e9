#include "crucible/observability/log_observer.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace crucible::observability {

namespace {

std::mutex g_log_mutex;

void log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ContainerTransitionEvent>) {
          log_line("DEBUG", "container.transition name=" + evt.container + " image=" + evt.image +
                                " " + evt.from_state + "->" + evt.to_state);
        } else if constexpr (std::is_same_v<T, ExecutionStartEvent>) {
          log_line("INFO", "execution.start session=" + evt.session_id +
                               " language=" + evt.language + " strategy=" + evt.strategy);
        } else if constexpr (std::is_same_v<T, ExecutionEndEvent>) {
          log_line("INFO", "execution.end session=" + evt.session_id + " status=" + evt.status +
                               " exit_code=" + std::to_string(evt.exit_code) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ProtocolStepEvent>) {
          log_line("DEBUG", "execution.step session=" + evt.session_id + " step=" + evt.step +
                                (evt.detail.empty() ? std::string() : " " + evt.detail));
        } else if constexpr (std::is_same_v<T, PoolEvictionEvent>) {
          log_line("INFO", "pool.evict key=" + evt.pool_key + " container=" + evt.container +
                               " idle_ms=" + std::to_string(evt.idle_for.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecutionLatencyMetric>) {
          log_line("DEBUG", "metric.execution_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line("DEBUG", "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line("DEBUG", "metric.queue_depth session=" + m.session_id +
                                " depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, PoolOccupancyMetric>) {
          log_line("DEBUG", "metric.pool key=" + m.pool_key + " idle=" + std::to_string(m.idle) +
                                " live=" + std::to_string(m.live));
        }
      },
      metric);
}

} // namespace crucible::observability
