#include "tutorplane/observability/factory.hpp"

#include "tutorplane/common/fs.hpp"
#include "tutorplane/observability/log_observer.hpp"
#include "tutorplane/observability/multi_observer.hpp"
#include "tutorplane/observability/noop_observer.hpp"

#include <sstream>

namespace tutorplane::observability {

namespace {

std::unique_ptr<IObserver> observer_for(const std::string &backend) {
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return observer_for(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty()) {
      multi->add(observer_for(name));
    }
  }
  return multi;
}

} // namespace tutorplane::observability
