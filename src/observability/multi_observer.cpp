#include "tutorplane/observability/multi_observer.hpp"

namespace tutorplane::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  if (!name_.empty()) {
    name_ += ',';
  }
  name_ += observer->name();
  observers_.push_back(std::move(observer));
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &observer : observers_) {
    observer->record_event(event);
  }
  if (std::holds_alternative<SafetyViolationEvent>(event) ||
      std::holds_alternative<ErrorEvent>(event)) {
    flush();
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &observer : observers_) {
    observer->flush();
  }
}

std::string_view MultiObserver::name() const {
  if (name_.empty()) {
    return "multi";
  }
  return name_;
}

} // namespace tutorplane::observability
