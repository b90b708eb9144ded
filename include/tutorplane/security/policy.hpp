#pragma once

#include "tutorplane/common/result.hpp"
#include "tutorplane/config/schema.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tutorplane::security {

/// Reduces "Name(arg, ...)" to "name". Returns nullopt for anything that is
/// not a single identifier optionally followed by one balanced argument group.
[[nodiscard]] std::optional<std::string> normalize_action_identifier(std::string_view raw);

/// Immutable after startup; shared as std::shared_ptr<const SafetyPolicy>.
class SafetyPolicy {
public:
  std::set<std::string> allowed_actions;
  std::uint32_t max_parameters = 10;
  std::vector<std::filesystem::path> writable_roots;
  std::set<std::string> shell_whitelist;
  std::filesystem::path shell_working_dir;
  std::chrono::seconds command_timeout{10};
  std::size_t command_output_chars = 1000;
  std::chrono::seconds exec_timeout{10};
  std::chrono::seconds compile_timeout{30};

  SafetyPolicy();

  [[nodiscard]] static common::Result<SafetyPolicy> from_config(const config::Config &config);

  /// Returns the normalized action name, or SafetyViolation.
  [[nodiscard]] common::Result<std::string>
  validate_plan(std::string_view action,
                const std::map<std::string, std::string> &parameters) const;

  [[nodiscard]] bool is_action_allowed(const std::string &action) const;
  [[nodiscard]] bool is_command_allowed(const std::string &name) const;

  /// Canonical form of `path` if it lies inside one of the writable roots,
  /// PermissionDenied otherwise.
  [[nodiscard]] common::Result<std::filesystem::path> check_writable(const std::string &path) const;
};

} // namespace tutorplane::security
