#include "tutorplane/tools/builtin/command.hpp"

#include "tutorplane/common/fs.hpp"

#include <vector>

namespace tutorplane::tools {

ExecuteCommandTool::ExecuteCommandTool(std::shared_ptr<const security::SafetyPolicy> policy,
                                       std::shared_ptr<sandbox::IProcessRunner> runner)
    : policy_(std::move(policy)), runner_(std::move(runner)) {}

std::string_view ExecuteCommandTool::description() const {
  return "Run a whitelisted command with arguments";
}

std::string ExecuteCommandTool::parameters_schema() const {
  return R"({"type":"object","required":["command"],"properties":{"command":{"type":"string"},"args":{"type":"array","items":{"type":"string"}}}})";
}

common::Result<ToolResult> ExecuteCommandTool::execute(const ToolArgs &args, const ToolContext &) {
  if (!policy_ || !runner_) {
    return common::Result<ToolResult>::failure("command execution unavailable");
  }

  auto command_arg = required_arg(args, "command");
  if (!command_arg.ok()) {
    return common::Result<ToolResult>::failure(command_arg.error_info());
  }
  const std::string command = common::trim(command_arg.value());
  if (!policy_->is_command_allowed(command)) {
    std::vector<std::string> whitelist(policy_->shell_whitelist.begin(),
                                       policy_->shell_whitelist.end());
    return common::Result<ToolResult>::failure(common::ErrorKind::PermissionDenied,
                                               "command not allowed: " + command +
                                                   " (whitelist: " + common::join(whitelist, ", ") +
                                                   ")");
  }

  std::vector<std::string> argv{command};
  if (const std::string raw_args = optional_arg(args, "args"); !raw_args.empty()) {
    auto parsed = common::json_parse_string_array(raw_args);
    if (!parsed.ok()) {
      return common::Result<ToolResult>::failure(common::ErrorKind::InvalidArguments,
                                                 "args must be a JSON array of strings: " +
                                                     parsed.error());
    }
    argv.insert(argv.end(), parsed.value().begin(), parsed.value().end());
  }

  const sandbox::ProcessOptions options{.timeout = policy_->command_timeout,
                                        .max_output_bytes = policy_->command_output_chars,
                                        .working_dir = policy_->shell_working_dir,
                                        .max_memory_mb = 0};
  auto ran = runner_->run(argv, options);
  if (!ran.ok()) {
    return common::Result<ToolResult>::failure(ran.error_info());
  }
  const sandbox::ProcessResult &process = ran.value();

  ToolResult result = make_result();
  result.set_string("command", common::join(argv, " "));
  result.set_string("stdout", process.stdout_text);
  result.set_string("stderr", process.stderr_text);
  result.set_int("return_code", process.exit_code);
  if (process.timed_out) {
    result.status = "timeout";
    result.error = common::Error{
        .kind = common::ErrorKind::ExecutionTimeout,
        .message = "command timed out (" + std::to_string(policy_->command_timeout.count()) +
                   "s limit)"};
  }
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace tutorplane::tools
