#include "tutorplane/control/action_plan.hpp"

#include "tutorplane/common/json_util.hpp"

namespace tutorplane::control {

namespace {

common::Result<std::map<std::string, std::string>> parse_member_object(const common::JsonFlatMap &root,
                                                                       const std::string &key) {
  const auto it = root.find(key);
  if (it == root.end()) {
    return common::Result<std::map<std::string, std::string>>::success({});
  }
  if (it->second.empty() || it->second.front() != '{') {
    return common::Result<std::map<std::string, std::string>>::failure(
        common::ErrorKind::InvalidArguments, "\"" + key + "\" must be a JSON object");
  }
  return common::json_parse_flat(it->second);
}

std::string error_json(const common::Error &error) {
  return common::json_object({
      {"kind", common::json_quote(std::string(common::error_kind_name(error.kind)))},
      {"message", common::json_quote(error.message)},
  });
}

} // namespace

std::string ActionPlan::to_json() const {
  return common::json_object({
      {"action", common::json_quote(action)},
      {"parameters", common::json_string_object(parameters)},
      {"context", common::json_string_object(context)},
  });
}

common::Result<ActionPlan> ActionPlan::from_json(const std::string &json) {
  auto root = common::json_parse_flat(json);
  if (!root.ok()) {
    return common::Result<ActionPlan>::failure(root.error_info());
  }

  ActionPlan plan;
  if (const auto it = root.value().find("action"); it != root.value().end()) {
    plan.action = it->second;
  }

  auto parameters = parse_member_object(root.value(), "parameters");
  if (!parameters.ok()) {
    return common::Result<ActionPlan>::failure(parameters.error_info());
  }
  plan.parameters = std::move(parameters.value());

  auto context = parse_member_object(root.value(), "context");
  if (!context.ok()) {
    return common::Result<ActionPlan>::failure(context.error_info());
  }
  plan.context = std::move(context.value());
  return common::Result<ActionPlan>::success(std::move(plan));
}

std::string ExecutionEnvelope::to_json() const {
  std::string payload = "null";
  if (result.has_value()) {
    payload = result->to_json();
  } else if (error.has_value()) {
    payload = error_json(*error);
  }

  common::JsonFields fields = {
      {"success", success ? "true" : "false"},
      {"action", common::json_quote(action)},
      {"result", payload},
  };
  if (error.has_value()) {
    fields.emplace_back("error", error_json(*error));
  }
  fields.emplace_back("metadata",
                      common::json_object({
                          {"execution_count", std::to_string(metadata.execution_count)},
                          {"safety_checks_passed", metadata.safety_checks_passed ? "true" : "false"},
                      }));
  return common::json_object(fields);
}

} // namespace tutorplane::control
