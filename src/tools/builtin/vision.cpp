#include "tutorplane/tools/builtin/vision.hpp"

namespace tutorplane::tools {

AnalyzeImageTool::AnalyzeImageTool(std::shared_ptr<IVisionAnalyzer> analyzer)
    : analyzer_(std::move(analyzer)) {}

std::string_view AnalyzeImageTool::description() const {
  return "Answer a question about an image using the configured vision analyzer";
}

std::string AnalyzeImageTool::parameters_schema() const {
  return R"({"type":"object","required":["image_path","question"],"properties":{"image_path":{"type":"string"},"question":{"type":"string"}}})";
}

common::Result<ToolResult> AnalyzeImageTool::execute(const ToolArgs &args, const ToolContext &) {
  auto image = required_arg(args, "image_path");
  if (!image.ok()) {
    return common::Result<ToolResult>::failure(image.error_info());
  }
  auto question = required_arg(args, "question");
  if (!question.ok()) {
    return common::Result<ToolResult>::failure(question.error_info());
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(image.value(), ec)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::NotFound,
                                               "image not found: " + image.value());
  }

  if (!analyzer_) {
    ToolResult result = make_result("no_agent_instance");
    result.set_string("message", "a vision analyzer is required for image analysis");
    return common::Result<ToolResult>::success(std::move(result));
  }

  auto analysis = analyzer_->analyze(image.value(), question.value());
  if (!analysis.ok()) {
    return common::Result<ToolResult>::failure(analysis.error_info());
  }

  ToolResult result = make_result();
  result.set_string("image", image.value());
  result.set_string("question", question.value());
  result.set_string("analysis", analysis.value());
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace tutorplane::tools
