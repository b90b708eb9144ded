#pragma once

#include "tutorplane/sandbox/executor.hpp"
#include "tutorplane/tools/tool.hpp"

#include <memory>

namespace tutorplane::tools {

class RunCodeTool final : public ITool {
public:
  explicit RunCodeTool(std::shared_ptr<const sandbox::SandboxExecutor> executor);

  [[nodiscard]] Action action() const override { return Action::RunCode; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return false; }
  [[nodiscard]] std::string_view group() const override { return "runtime"; }

private:
  std::shared_ptr<const sandbox::SandboxExecutor> executor_;
};

/// Maps a sandbox outcome onto the tool result shape, attaching an error for
/// anything other than Success.
[[nodiscard]] ToolResult sandbox_tool_result(const sandbox::SandboxResult &outcome);

} // namespace tutorplane::tools
