#pragma once

#include "tutorplane/tools/tool.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace tutorplane::tools {

/// Answers a question about an image. No implementation ships in-tree.
class IVisionAnalyzer {
public:
  virtual ~IVisionAnalyzer() = default;

  [[nodiscard]] virtual common::Result<std::string> analyze(const std::filesystem::path &image,
                                                            const std::string &question) = 0;
};

class AnalyzeImageTool final : public ITool {
public:
  explicit AnalyzeImageTool(std::shared_ptr<IVisionAnalyzer> analyzer = nullptr);

  [[nodiscard]] Action action() const override { return Action::AnalyzeImage; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "vision"; }

private:
  std::shared_ptr<IVisionAnalyzer> analyzer_;
};

} // namespace tutorplane::tools
