#include "tutorplane/observability/global.hpp"

#include <mutex>

namespace tutorplane::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

// The lock is held while recording so an observer cannot be replaced mid-call.
void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_action_executed(const std::string &action, const std::chrono::milliseconds duration,
                            const bool tool_succeeded, const std::uint64_t execution_count) {
  record_event(ActionExecutedEvent{.action = action,
                                   .duration = duration,
                                   .tool_succeeded = tool_succeeded,
                                   .execution_count = execution_count});
  record_metric(AuditLogSizeMetric{.entries = execution_count});
}

void record_safety_violation(const std::string &action, const std::string &reason) {
  record_event(SafetyViolationEvent{.action = action, .reason = reason});
}

void record_sandbox_run(const std::string &language, const std::string &status,
                        const std::string &phase, const int exit_code,
                        const std::chrono::milliseconds latency) {
  record_event(SandboxRunEvent{
      .language = language, .status = status, .phase = phase, .exit_code = exit_code});
  record_metric(SandboxLatencyMetric{.language = language, .latency = latency});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace tutorplane::observability
