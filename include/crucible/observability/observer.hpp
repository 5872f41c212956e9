#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace crucible::observability {

struct ContainerTransitionEvent {
  std::string container;
  std::string image;
  std::string from_state;
  std::string to_state;
};

struct ExecutionStartEvent {
  std::string session_id;
  std::string language;
  std::string strategy;
};

struct ExecutionEndEvent {
  std::string session_id;
  std::string language;
  std::string status;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
};

struct ProtocolStepEvent {
  std::string session_id;
  std::string step;
  std::string detail;
};

struct PoolEvictionEvent {
  std::string pool_key;
  std::string container;
  std::chrono::milliseconds idle_for{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ContainerTransitionEvent, ExecutionStartEvent, ExecutionEndEvent,
                                   ProtocolStepEvent, PoolEvictionEvent, ErrorEvent>;

struct ExecutionLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct QueueDepthMetric {
  std::string session_id;
  std::uint64_t depth = 0;
};

struct PoolOccupancyMetric {
  std::string pool_key;
  std::uint64_t idle = 0;
  std::uint64_t live = 0;
};

using ObserverMetric = std::variant<ExecutionLatencyMetric, ActiveSessionsMetric, QueueDepthMetric,
                                    PoolOccupancyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace crucible::observability
