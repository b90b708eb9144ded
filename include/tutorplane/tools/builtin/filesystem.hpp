#pragma once

#include "tutorplane/security/policy.hpp"
#include "tutorplane/tools/tool.hpp"

#include <memory>

namespace tutorplane::tools {

inline constexpr std::size_t kReadFileMaxChars = 5000;

class ReadFileTool final : public ITool {
public:
  [[nodiscard]] Action action() const override { return Action::ReadFile; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "fs"; }
};

class ListDirectoryTool final : public ITool {
public:
  [[nodiscard]] Action action() const override { return Action::ListDirectory; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "fs"; }
};

class WriteFileTool final : public ITool {
public:
  explicit WriteFileTool(std::shared_ptr<const security::SafetyPolicy> policy);

  [[nodiscard]] Action action() const override { return Action::WriteFile; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return false; }
  [[nodiscard]] std::string_view group() const override { return "fs"; }

private:
  std::shared_ptr<const security::SafetyPolicy> policy_;
};

class DeleteFileTool final : public ITool {
public:
  explicit DeleteFileTool(std::shared_ptr<const security::SafetyPolicy> policy);

  [[nodiscard]] Action action() const override { return Action::DeleteFile; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return false; }
  [[nodiscard]] std::string_view group() const override { return "fs"; }

private:
  std::shared_ptr<const security::SafetyPolicy> policy_;
};

} // namespace tutorplane::tools
