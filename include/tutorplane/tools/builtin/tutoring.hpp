#pragma once

#include "tutorplane/store/tutor_store.hpp"
#include "tutorplane/tools/tool.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tutorplane::tools {

/// Fixed question bank; unknown topics get a general comprehension check.
[[nodiscard]] std::vector<std::string> assessment_questions(const std::string &topic);

class AssessUnderstandingTool final : public ITool {
public:
  [[nodiscard]] Action action() const override { return Action::AssessUnderstanding; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "tutoring"; }
};

class UpdateLearnerProfileTool final : public ITool {
public:
  explicit UpdateLearnerProfileTool(std::shared_ptr<store::ITutorStore> store);

  [[nodiscard]] Action action() const override { return Action::UpdateLearnerProfile; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "tutoring"; }

private:
  std::shared_ptr<store::ITutorStore> store_;
};

class LogInteractionTool final : public ITool {
public:
  explicit LogInteractionTool(std::shared_ptr<store::ITutorStore> store);

  [[nodiscard]] Action action() const override { return Action::LogInteraction; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "tutoring"; }

private:
  std::shared_ptr<store::ITutorStore> store_;
};

class SetAssignmentTool final : public ITool {
public:
  [[nodiscard]] Action action() const override { return Action::SetAssignment; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "tutoring"; }
};

} // namespace tutorplane::tools
