#include "tutorplane/control/action_router.hpp"

#include "tutorplane/tools/builtin/command.hpp"
#include "tutorplane/tools/builtin/filesystem.hpp"
#include "tutorplane/tools/builtin/knowledge.hpp"
#include "tutorplane/tools/builtin/run_code.hpp"
#include "tutorplane/tools/builtin/tutoring.hpp"
#include "tutorplane/tools/builtin/web.hpp"

namespace tutorplane::control {

void ActionRouter::register_tool(std::unique_ptr<tools::ITool> tool) {
  if (!tool) {
    return;
  }
  const auto index = tools::action_index(tool->action());
  tools_[index] = std::move(tool);
}

tools::ITool *ActionRouter::get_tool(const tools::Action action) const {
  return tools_[tools::action_index(action)].get();
}

std::vector<tools::ToolSpec> ActionRouter::all_specs() const {
  std::vector<tools::ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    if (tool) {
      specs.push_back(tool->spec());
    }
  }
  return specs;
}

tools::ToolResult ActionRouter::route(const std::string_view action, const tools::ToolArgs &args,
                                      const tools::ToolContext &ctx) const {
  const std::string name(action);
  const auto resolved = tools::action_from_string(action);
  tools::ITool *tool = resolved.has_value() ? get_tool(*resolved) : nullptr;
  if (tool == nullptr) {
    return tools::ToolResult::failure(
        name, common::Error{.kind = common::ErrorKind::UnknownAction,
                            .message = "unknown action: " + name});
  }

  try {
    auto executed = tool->execute(args, ctx);
    if (!executed.ok()) {
      return tools::ToolResult::failure(name, executed.error_info());
    }
    tools::ToolResult result = std::move(executed.value());
    if (result.tool.empty()) {
      result.tool = name;
    }
    return result;
  } catch (const std::exception &ex) {
    return tools::ToolResult::failure(
        name, common::Error{.kind = common::ErrorKind::InternalError,
                            .message = name + " failed: " + ex.what()});
  }
}

ActionRouter ActionRouter::create_default(const RouterDependencies &deps) {
  ActionRouter router;
  router.register_tool(std::make_unique<tools::SearchKnowledgeTool>(deps.store, deps.search_top_k));
  router.register_tool(std::make_unique<tools::AssessUnderstandingTool>());
  router.register_tool(std::make_unique<tools::UpdateLearnerProfileTool>(deps.store));
  router.register_tool(std::make_unique<tools::LogInteractionTool>(deps.store));
  router.register_tool(std::make_unique<tools::ReadFileTool>());
  router.register_tool(std::make_unique<tools::ListDirectoryTool>());
  router.register_tool(std::make_unique<tools::IngestDocumentTool>(deps.store));
  router.register_tool(std::make_unique<tools::AnalyzeImageTool>(deps.vision));
  router.register_tool(std::make_unique<tools::WriteFileTool>(deps.policy));
  router.register_tool(std::make_unique<tools::DeleteFileTool>(deps.policy));
  router.register_tool(std::make_unique<tools::WebSearchTool>(deps.http, deps.web));
  router.register_tool(std::make_unique<tools::FetchUrlTool>(deps.http, deps.web));
  router.register_tool(std::make_unique<tools::ExecuteCommandTool>(deps.policy, deps.runner));
  router.register_tool(std::make_unique<tools::RunCodeTool>(deps.executor));
  router.register_tool(std::make_unique<tools::SetAssignmentTool>());
  return router;
}

} // namespace tutorplane::control
