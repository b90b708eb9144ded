#pragma once

#include "tutorplane/store/tutor_store.hpp"
#include "tutorplane/tools/tool.hpp"

#include <cstddef>
#include <memory>

namespace tutorplane::tools {

class SearchKnowledgeTool final : public ITool {
public:
  SearchKnowledgeTool(std::shared_ptr<store::ITutorStore> store, std::size_t top_k = 3);

  [[nodiscard]] Action action() const override { return Action::SearchKnowledge; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "knowledge"; }

private:
  std::shared_ptr<store::ITutorStore> store_;
  std::size_t top_k_;
};

/// Plain-text documents only; binary formats are refused.
class IngestDocumentTool final : public ITool {
public:
  explicit IngestDocumentTool(std::shared_ptr<store::ITutorStore> store);

  [[nodiscard]] Action action() const override { return Action::IngestDocument; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "knowledge"; }

private:
  std::shared_ptr<store::ITutorStore> store_;
};

} // namespace tutorplane::tools
