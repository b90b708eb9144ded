#include "tutorplane/tools/tool.hpp"

#include "tutorplane/common/fs.hpp"

namespace tutorplane::tools {

void ToolResult::set_raw(const std::string &key, std::string json) {
  for (auto &[name, value] : fields) {
    if (name == key) {
      value = std::move(json);
      return;
    }
  }
  fields.emplace_back(key, std::move(json));
}

void ToolResult::set_string(const std::string &key, const std::string &value) {
  set_raw(key, common::json_quote(value));
}

void ToolResult::set_int(const std::string &key, const std::int64_t value) {
  set_raw(key, std::to_string(value));
}

void ToolResult::set_bool(const std::string &key, const bool value) {
  set_raw(key, value ? "true" : "false");
}

const std::string *ToolResult::field(const std::string &key) const {
  for (const auto &[name, value] : fields) {
    if (name == key) {
      return &value;
    }
  }
  return nullptr;
}

std::string ToolResult::string_field(const std::string &key) const {
  const std::string *raw = field(key);
  if (raw == nullptr || raw->size() < 2 || raw->front() != '"' || raw->back() != '"') {
    return "";
  }
  return common::json_unescape(raw->substr(1, raw->size() - 2));
}

std::string ToolResult::to_json() const {
  common::JsonFields out;
  out.reserve(fields.size() + 3);
  out.emplace_back("tool", common::json_quote(tool));
  out.emplace_back("status", common::json_quote(status));
  for (const auto &entry : fields) {
    out.push_back(entry);
  }
  if (error.has_value()) {
    out.emplace_back("error",
                     common::json_object({
                         {"kind", common::json_quote(std::string(common::error_kind_name(error->kind)))},
                         {"message", common::json_quote(error->message)},
                     }));
  }
  return common::json_object(out);
}

ToolResult ToolResult::failure(std::string tool, common::Error error) {
  ToolResult result;
  result.tool = std::move(tool);
  result.status = "error";
  result.error = std::move(error);
  return result;
}

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters_json = parameters_schema(),
                  .safe = is_safe(),
                  .group = std::string(group())};
}

ToolResult ITool::make_result(std::string status) const {
  ToolResult result;
  result.tool = std::string(name());
  result.status = std::move(status);
  return result;
}

common::Result<std::string> required_arg(const ToolArgs &args, const std::string &key) {
  const auto it = args.find(key);
  if (it == args.end() || common::trim(it->second).empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::InvalidArguments,
                                                "missing required parameter: " + key);
  }
  return common::Result<std::string>::success(it->second);
}

std::string optional_arg(const ToolArgs &args, const std::string &key,
                         const std::string &fallback) {
  const auto it = args.find(key);
  if (it == args.end() || common::trim(it->second).empty()) {
    return fallback;
  }
  return it->second;
}

} // namespace tutorplane::tools
