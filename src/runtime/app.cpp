#include "tutorplane/runtime/app.hpp"

#include "tutorplane/common/fs.hpp"
#include "tutorplane/config/config.hpp"
#include "tutorplane/observability/factory.hpp"
#include "tutorplane/observability/global.hpp"
#include "tutorplane/security/policy.hpp"

namespace tutorplane::runtime {

App::App(config::Config config) : config_(std::move(config)) {}

common::Result<std::unique_ptr<App>> App::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<std::unique_ptr<App>>::failure(loaded.error_info());
  }
  return create(std::move(loaded.value()));
}

common::Result<std::unique_ptr<App>> App::create(config::Config config, AppOverrides overrides) {
  auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<App>>::failure(validated.error_info());
  }

  if (overrides.install_observer) {
    observability::set_global_observer(observability::create_observer(config));
  }

  auto policy = security::SafetyPolicy::from_config(config);
  if (!policy.ok()) {
    return common::Result<std::unique_ptr<App>>::failure(policy.error_info());
  }

  std::unique_ptr<App> app(new App(std::move(config)));
  app->warnings_ = std::move(validated.value());
  app->policy_ = std::make_shared<const security::SafetyPolicy>(std::move(policy.value()));

  // The store is optional: without it the knowledge and profile tools report
  // themselves unavailable and everything else keeps working.
  if (overrides.store) {
    app->store_ = std::move(overrides.store);
  } else {
    const std::string db_path = common::expand_path(app->config_.storage.database_path);
    auto opened = store::SqliteTutorStore::open(db_path);
    if (opened.ok()) {
      app->store_ = std::move(opened.value());
    } else {
      app->warnings_.push_back("tutor store unavailable: " + opened.error());
      observability::record_error("store", opened.error());
    }
  }

  std::shared_ptr<sandbox::IProcessRunner> runner = std::move(overrides.runner);
  if (!runner) {
    runner = std::make_shared<sandbox::PosixProcessRunner>();
  }
  std::shared_ptr<tools::IHttpClient> http = std::move(overrides.http);
  if (!http) {
    http = std::make_shared<tools::CurlHttpClient>();
  }

  auto limits = sandbox::SandboxLimits::from_config(app->config_);
  limits.scratch_dir = common::expand_path(limits.scratch_dir.string());
  app->executor_ = std::make_shared<const sandbox::SandboxExecutor>(std::move(limits), runner);

  control::RouterDependencies deps{.policy = app->policy_,
                                   .store = app->store_,
                                   .executor = app->executor_,
                                   .runner = runner,
                                   .http = std::move(http),
                                   .vision = std::move(overrides.vision),
                                   .web = app->config_.web,
                                   .search_top_k = app->config_.storage.search_top_k};
  app->router_ =
      std::make_shared<const control::ActionRouter>(control::ActionRouter::create_default(deps));

  const std::string journal = common::expand_path(app->config_.audit.journal_path);
  app->audit_ = std::make_shared<control::AuditLog>(journal);
  app->control_plane_ =
      std::make_unique<control::ControlPlane>(app->policy_, app->router_, app->audit_);

  return common::Result<std::unique_ptr<App>>::success(std::move(app));
}

} // namespace tutorplane::runtime
