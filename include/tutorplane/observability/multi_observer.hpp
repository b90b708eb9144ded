#pragma once

#include "tutorplane/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tutorplane::observability {

/// Fans out to every configured backend. Members are added before the
/// observer is installed; dispatch itself takes no lock.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);

  /// SafetyViolationEvent and ErrorEvent are flushed to every member as soon
  /// as they are recorded.
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  /// Member names joined by commas, e.g. "log,noop".
  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
  std::string name_;
};

} // namespace tutorplane::observability
