#pragma once

#include "tutorplane/config/schema.hpp"
#include "tutorplane/observability/observer.hpp"

#include <memory>

namespace tutorplane::observability {

/// "log", "none", or a comma list of those. Unknown names fall back to "log".
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace tutorplane::observability
