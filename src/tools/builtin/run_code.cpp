#include "tutorplane/tools/builtin/run_code.hpp"

namespace tutorplane::tools {

ToolResult sandbox_tool_result(const sandbox::SandboxResult &outcome) {
  ToolResult result;
  result.tool = std::string(action_name(Action::RunCode));
  result.status = std::string(sandbox::sandbox_status_name(outcome.status));
  result.set_string("language", outcome.language);
  result.set_string("phase", std::string(sandbox::sandbox_phase_name(outcome.phase)));
  result.set_string("stdout", outcome.stdout_text);
  result.set_string("stderr", outcome.stderr_text);
  result.set_int("return_code", outcome.exit_code);
  result.set_bool("stdout_truncated", outcome.stdout_truncated);
  result.set_bool("stderr_truncated", outcome.stderr_truncated);
  result.set_int("duration_ms", static_cast<std::int64_t>(outcome.duration.count()));

  switch (outcome.status) {
  case sandbox::SandboxStatus::Success:
    break;
  case sandbox::SandboxStatus::CompilationError:
    result.error = common::Error{.kind = common::ErrorKind::CompilationError,
                                 .message = "compilation failed for " + outcome.language};
    break;
  case sandbox::SandboxStatus::Timeout:
    result.error = common::Error{.kind = common::ErrorKind::ExecutionTimeout,
                                 .message = outcome.error};
    break;
  case sandbox::SandboxStatus::InternalError:
    result.error = common::Error{.kind = common::ErrorKind::InternalError,
                                 .message = outcome.error};
    break;
  }
  result.sandbox = outcome;
  return result;
}

RunCodeTool::RunCodeTool(std::shared_ptr<const sandbox::SandboxExecutor> executor)
    : executor_(std::move(executor)) {}

std::string_view RunCodeTool::description() const {
  return "Compile and run a program in an isolated scratch directory";
}

std::string RunCodeTool::parameters_schema() const {
  return R"({"type":"object","required":["code"],"properties":{"code":{"type":"string"},"language":{"type":"string","enum":["python","javascript","go","rust","c","cpp"],"default":"python"}}})";
}

common::Result<ToolResult> RunCodeTool::execute(const ToolArgs &args, const ToolContext &) {
  if (!executor_) {
    return common::Result<ToolResult>::failure("sandbox executor unavailable");
  }
  auto code = required_arg(args, "code");
  if (!code.ok()) {
    return common::Result<ToolResult>::failure(code.error_info());
  }

  const auto outcome = executor_->run(optional_arg(args, "language", "python"), code.value());
  return common::Result<ToolResult>::success(sandbox_tool_result(outcome));
}

} // namespace tutorplane::tools
