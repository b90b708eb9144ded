#include "tutorplane/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace tutorplane::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ActionExecutedEvent>) {
          log_line("INFO", "action.executed name=" + evt.action +
                               " ok=" + (evt.tool_succeeded ? std::string("true")
                                                            : std::string("false")) +
                               " count=" + std::to_string(evt.execution_count) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SafetyViolationEvent>) {
          log_line("WARN", "safety.rejected action=\"" + evt.action + "\" reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, SandboxRunEvent>) {
          log_line("INFO", "sandbox.run language=" + evt.language + " status=" + evt.status +
                               " phase=" + evt.phase + " exit=" + std::to_string(evt.exit_code));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AuditLogSizeMetric>) {
          log_line("DEBUG", "metric.audit_log_size=" + std::to_string(m.entries));
        } else if constexpr (std::is_same_v<T, SandboxLatencyMetric>) {
          log_line("DEBUG", "metric.sandbox_latency_ms{" + m.language +
                                "}=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

} // namespace tutorplane::observability
