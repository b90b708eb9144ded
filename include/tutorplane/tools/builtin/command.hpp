#pragma once

#include "tutorplane/sandbox/process.hpp"
#include "tutorplane/security/policy.hpp"
#include "tutorplane/tools/tool.hpp"

#include <memory>

namespace tutorplane::tools {

/// Whitelisted commands only, executed as an argument vector.
class ExecuteCommandTool final : public ITool {
public:
  ExecuteCommandTool(std::shared_ptr<const security::SafetyPolicy> policy,
                     std::shared_ptr<sandbox::IProcessRunner> runner);

  [[nodiscard]] Action action() const override { return Action::ExecuteCommand; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return false; }
  [[nodiscard]] std::string_view group() const override { return "runtime"; }

private:
  std::shared_ptr<const security::SafetyPolicy> policy_;
  std::shared_ptr<sandbox::IProcessRunner> runner_;
};

} // namespace tutorplane::tools
