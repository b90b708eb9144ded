#pragma once

#include "tutorplane/observability/observer.hpp"

#include <memory>
#include <string>

namespace tutorplane::observability {

/// Installs the process-wide observer. Passing nullptr disables recording.
void set_global_observer(std::unique_ptr<IObserver> observer);

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_action_executed(const std::string &action, std::chrono::milliseconds duration,
                            bool tool_succeeded, std::uint64_t execution_count);
void record_safety_violation(const std::string &action, const std::string &reason);
void record_sandbox_run(const std::string &language, const std::string &status,
                        const std::string &phase, int exit_code,
                        std::chrono::milliseconds latency);
void record_error(const std::string &component, const std::string &message);

} // namespace tutorplane::observability
