#pragma once

#include "tutorplane/common/result.hpp"
#include "tutorplane/tools/tool.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace tutorplane::control {

/// One requested tool invocation. Parameter values are strings; structured
/// values travel as JSON text.
struct ActionPlan {
  std::string action;
  std::map<std::string, std::string> parameters;
  std::map<std::string, std::string> context;

  [[nodiscard]] std::string to_json() const;
  /// Parses {"action": "...", "parameters": {...}, "context": {...}}.
  /// Non-string parameter values are kept as their JSON text.
  [[nodiscard]] static common::Result<ActionPlan> from_json(const std::string &json);
};

struct ExecutionMetadata {
  std::uint64_t execution_count = 0;
  bool safety_checks_passed = false;
};

/// What execute() hands back. Exactly one of result and error is set.
struct ExecutionEnvelope {
  bool success = false;
  std::string action;
  std::optional<tools::ToolResult> result;
  std::optional<common::Error> error;
  ExecutionMetadata metadata;

  [[nodiscard]] std::string to_json() const;
};

} // namespace tutorplane::control
