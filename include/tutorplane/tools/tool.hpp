#pragma once

#include "tutorplane/common/json_util.hpp"
#include "tutorplane/common/result.hpp"
#include "tutorplane/sandbox/executor.hpp"
#include "tutorplane/tools/action.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tutorplane::tools {

/// Parameter values are strings; arrays and objects arrive as JSON text.
using ToolArgs = std::map<std::string, std::string>;

struct ToolContext {
  std::string session_id;
  std::map<std::string, std::string> values;
};

/// The value a tool hands back to the caller. Fields hold encoded JSON
/// fragments in insertion order.
struct ToolResult {
  std::string tool;
  std::string status = "success";
  common::JsonFields fields;
  std::optional<common::Error> error;
  std::optional<sandbox::SandboxResult> sandbox;

  void set_raw(const std::string &key, std::string json);
  void set_string(const std::string &key, const std::string &value);
  void set_int(const std::string &key, std::int64_t value);
  void set_bool(const std::string &key, bool value);

  /// Encoded JSON of a field, nullptr when absent.
  [[nodiscard]] const std::string *field(const std::string &key) const;
  /// Decoded value of a string field; empty when absent or not a string.
  [[nodiscard]] std::string string_field(const std::string &key) const;

  [[nodiscard]] bool ok() const { return !error.has_value(); }
  [[nodiscard]] std::string to_json() const;

  [[nodiscard]] static ToolResult failure(std::string tool, common::Error error);
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
  bool safe = false;
  std::string group;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual Action action() const = 0;
  [[nodiscard]] std::string_view name() const { return action_name(action()); }
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  [[nodiscard]] virtual bool is_safe() const = 0;
  [[nodiscard]] virtual std::string_view group() const = 0;

  [[nodiscard]] ToolSpec spec() const;

protected:
  [[nodiscard]] ToolResult make_result(std::string status = "success") const;
};

/// InvalidArguments when the key is absent or blank.
[[nodiscard]] common::Result<std::string> required_arg(const ToolArgs &args,
                                                       const std::string &key);
[[nodiscard]] std::string optional_arg(const ToolArgs &args, const std::string &key,
                                       const std::string &fallback = "");

} // namespace tutorplane::tools
