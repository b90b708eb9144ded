#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tutorplane::observability {

struct ActionExecutedEvent {
  std::string action;
  std::chrono::milliseconds duration{0};
  bool tool_succeeded = false;
  std::uint64_t execution_count = 0;
};

/// A plan rejected before routing. Never appears in the audit log.
struct SafetyViolationEvent {
  std::string action;
  std::string reason;
};

struct SandboxRunEvent {
  std::string language;
  std::string status;
  std::string phase;
  int exit_code = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ActionExecutedEvent, SafetyViolationEvent, SandboxRunEvent, ErrorEvent>;

struct AuditLogSizeMetric {
  std::uint64_t entries = 0;
};

struct SandboxLatencyMetric {
  std::string language;
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<AuditLogSizeMetric, SandboxLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace tutorplane::observability
