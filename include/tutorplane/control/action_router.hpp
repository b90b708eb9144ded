#pragma once

#include "tutorplane/config/schema.hpp"
#include "tutorplane/sandbox/executor.hpp"
#include "tutorplane/sandbox/process.hpp"
#include "tutorplane/security/policy.hpp"
#include "tutorplane/store/tutor_store.hpp"
#include "tutorplane/tools/builtin/vision.hpp"
#include "tutorplane/tools/http.hpp"
#include "tutorplane/tools/tool.hpp"

#include <array>
#include <memory>
#include <string_view>
#include <vector>

namespace tutorplane::control {

/// Collaborators the builtin tools are constructed with. Null members leave
/// the affected tools reporting themselves unavailable.
struct RouterDependencies {
  std::shared_ptr<const security::SafetyPolicy> policy;
  std::shared_ptr<store::ITutorStore> store;
  std::shared_ptr<const sandbox::SandboxExecutor> executor;
  std::shared_ptr<sandbox::IProcessRunner> runner;
  std::shared_ptr<tools::IHttpClient> http;
  std::shared_ptr<tools::IVisionAnalyzer> vision;
  config::WebConfig web;
  std::size_t search_top_k = 3;
};

/// Dispatches a normalized action name to its tool. Holds no policy.
class ActionRouter {
public:
  ActionRouter() = default;

  /// Replaces any tool already registered for the same action.
  void register_tool(std::unique_ptr<tools::ITool> tool);
  [[nodiscard]] tools::ITool *get_tool(tools::Action action) const;
  [[nodiscard]] std::vector<tools::ToolSpec> all_specs() const;

  /// Never throws; unknown actions, tool failures and exceptions all come
  /// back as a ToolResult carrying an error.
  [[nodiscard]] tools::ToolResult route(std::string_view action, const tools::ToolArgs &args,
                                        const tools::ToolContext &ctx) const;

  [[nodiscard]] static ActionRouter create_default(const RouterDependencies &deps);

private:
  std::array<std::unique_ptr<tools::ITool>, tools::kActionCount> tools_;
};

} // namespace tutorplane::control
