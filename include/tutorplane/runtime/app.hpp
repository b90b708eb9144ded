#pragma once

#include "tutorplane/common/result.hpp"
#include "tutorplane/config/schema.hpp"
#include "tutorplane/control/control_plane.hpp"
#include "tutorplane/sandbox/executor.hpp"
#include "tutorplane/store/tutor_store.hpp"
#include "tutorplane/tools/builtin/vision.hpp"
#include "tutorplane/tools/http.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tutorplane::runtime {

/// Replacements for the collaborators App would otherwise build itself.
struct AppOverrides {
  std::shared_ptr<sandbox::IProcessRunner> runner;
  std::shared_ptr<tools::IHttpClient> http;
  std::shared_ptr<store::ITutorStore> store;
  std::shared_ptr<tools::IVisionAnalyzer> vision;
  bool install_observer = true;
};

/// Owns every long-lived object and wires them from a Config.
class App {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<App>> create(config::Config config,
                                                                   AppOverrides overrides = {});
  [[nodiscard]] static common::Result<std::unique_ptr<App>> from_disk();

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] control::ControlPlane &control_plane() { return *control_plane_; }
  [[nodiscard]] const sandbox::SandboxExecutor &sandbox() const { return *executor_; }
  [[nodiscard]] const control::ActionRouter &router() const { return *router_; }
  /// Null when the database could not be opened.
  [[nodiscard]] store::ITutorStore *store() const { return store_.get(); }
  [[nodiscard]] const std::vector<std::string> &warnings() const { return warnings_; }

private:
  explicit App(config::Config config);

  config::Config config_;
  std::vector<std::string> warnings_;
  std::shared_ptr<const security::SafetyPolicy> policy_;
  std::shared_ptr<store::ITutorStore> store_;
  std::shared_ptr<const sandbox::SandboxExecutor> executor_;
  std::shared_ptr<const control::ActionRouter> router_;
  std::shared_ptr<control::AuditLog> audit_;
  std::unique_ptr<control::ControlPlane> control_plane_;
};

} // namespace tutorplane::runtime
