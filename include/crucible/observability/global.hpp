#pragma once

#include "crucible/observability/observer.hpp"

#include <memory>

namespace crucible::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_container_transition(const std::string &container, const std::string &image,
                                 const std::string &from_state, const std::string &to_state);
void record_execution_start(const std::string &session_id, const std::string &language,
                            const std::string &strategy);
void record_execution_end(const std::string &session_id, const std::string &language,
                          const std::string &status, int exit_code,
                          std::chrono::milliseconds duration);
void record_protocol_step(const std::string &session_id, const std::string &step,
                          const std::string &detail = "");
void record_pool_eviction(const std::string &pool_key, const std::string &container,
                          std::chrono::milliseconds idle_for);
void record_error(const std::string &component, const std::string &message);

} // namespace crucible::observability
