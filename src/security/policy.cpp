#include "tutorplane/security/policy.hpp"

#include "tutorplane/common/fs.hpp"

#include <cctype>

namespace tutorplane::security {

namespace {

bool is_identifier_start(const char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool is_identifier_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

} // namespace

std::optional<std::string> normalize_action_identifier(std::string_view raw) {
  while (!raw.empty() && is_space(raw.front())) {
    raw.remove_prefix(1);
  }
  while (!raw.empty() && is_space(raw.back())) {
    raw.remove_suffix(1);
  }
  if (raw.empty() || !is_identifier_start(raw.front())) {
    return std::nullopt;
  }

  std::size_t pos = 0;
  while (pos < raw.size() && is_identifier_char(raw[pos])) {
    ++pos;
  }
  const std::string name = common::to_lower(std::string(raw.substr(0, pos)));

  while (pos < raw.size() && is_space(raw[pos])) {
    ++pos;
  }
  if (pos == raw.size()) {
    return name;
  }
  if (raw[pos] != '(') {
    return std::nullopt;
  }

  // The argument group must balance and close the string.
  int depth = 0;
  for (; pos < raw.size(); ++pos) {
    if (raw[pos] == '(') {
      ++depth;
    } else if (raw[pos] == ')') {
      --depth;
      if (depth == 0) {
        break;
      }
    }
  }
  if (depth != 0 || pos + 1 != raw.size()) {
    return std::nullopt;
  }
  return name;
}

SafetyPolicy::SafetyPolicy() {
  const config::SafetyConfig safety;
  allowed_actions = {safety.allowed_actions.begin(), safety.allowed_actions.end()};
  writable_roots = {safety.writable_roots.begin(), safety.writable_roots.end()};
  shell_whitelist = {safety.shell_whitelist.begin(), safety.shell_whitelist.end()};
}

common::Result<SafetyPolicy> SafetyPolicy::from_config(const config::Config &config) {
  SafetyPolicy policy;

  policy.allowed_actions.clear();
  for (const auto &action : config.safety.allowed_actions) {
    const auto normalized = normalize_action_identifier(action);
    if (!normalized.has_value()) {
      return common::Result<SafetyPolicy>::failure(common::ErrorKind::InvalidArguments,
                                                   "invalid action name in allowed_actions: " +
                                                       action);
    }
    policy.allowed_actions.insert(*normalized);
  }

  policy.max_parameters = config.safety.max_parameters;
  policy.writable_roots.clear();
  for (const auto &root : config.safety.writable_roots) {
    policy.writable_roots.emplace_back(common::expand_path(root));
  }
  policy.shell_whitelist = {config.safety.shell_whitelist.begin(),
                            config.safety.shell_whitelist.end()};
  if (!config.safety.shell_working_dir.empty()) {
    policy.shell_working_dir = common::expand_path(config.safety.shell_working_dir);
  }
  policy.command_timeout = std::chrono::seconds(config.safety.command_timeout_seconds);
  policy.command_output_chars = static_cast<std::size_t>(config.safety.command_output_chars);
  policy.exec_timeout = std::chrono::seconds(config.sandbox.exec_timeout_seconds);
  policy.compile_timeout = std::chrono::seconds(config.sandbox.compile_timeout_seconds);

  return common::Result<SafetyPolicy>::success(std::move(policy));
}

common::Result<std::string>
SafetyPolicy::validate_plan(const std::string_view action,
                            const std::map<std::string, std::string> &parameters) const {
  const auto normalized = normalize_action_identifier(action);
  if (!normalized.has_value()) {
    return common::Result<std::string>::failure(common::ErrorKind::SafetyViolation,
                                                "safety validation failed: malformed action '" +
                                                    std::string(action) + "'");
  }
  if (!is_action_allowed(*normalized)) {
    return common::Result<std::string>::failure(common::ErrorKind::SafetyViolation,
                                                "safety validation failed: action '" +
                                                    *normalized + "' is not allowed");
  }
  if (parameters.size() > max_parameters) {
    return common::Result<std::string>::failure(
        common::ErrorKind::SafetyViolation,
        "safety validation failed: " + std::to_string(parameters.size()) +
            " parameters exceeds the limit of " + std::to_string(max_parameters));
  }
  for (const auto &[key, value] : parameters) {
    if (common::trim(key).empty()) {
      return common::Result<std::string>::failure(common::ErrorKind::SafetyViolation,
                                                  "safety validation failed: empty parameter name");
    }
  }
  return common::Result<std::string>::success(*normalized);
}

bool SafetyPolicy::is_action_allowed(const std::string &action) const {
  return allowed_actions.contains(action);
}

bool SafetyPolicy::is_command_allowed(const std::string &name) const {
  if (name.empty() || name.find('/') != std::string::npos) {
    return false;
  }
  for (const char ch : name) {
    if (is_space(ch)) {
      return false;
    }
  }
  return shell_whitelist.contains(name);
}

common::Result<std::filesystem::path> SafetyPolicy::check_writable(const std::string &path) const {
  using PathResult = common::Result<std::filesystem::path>;
  if (path.empty()) {
    return PathResult::failure(common::ErrorKind::InvalidArguments, "path is empty");
  }
  if (path.find('\0') != std::string::npos) {
    return PathResult::failure(common::ErrorKind::PermissionDenied, "path contains a NUL byte");
  }

  std::error_code ec;
  const auto absolute = std::filesystem::absolute(std::filesystem::path(path), ec);
  if (ec) {
    return PathResult::failure(common::ErrorKind::PermissionDenied,
                               "cannot resolve path: " + ec.message());
  }
  const auto candidate = std::filesystem::weakly_canonical(absolute, ec);
  if (ec) {
    return PathResult::failure(common::ErrorKind::PermissionDenied,
                               "cannot resolve path: " + ec.message());
  }

  for (const auto &root : writable_roots) {
    auto canonical_root = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
      ec.clear();
      canonical_root = root.lexically_normal();
    }
    if (common::is_subpath(candidate, canonical_root)) {
      return PathResult::success(candidate);
    }
  }

  return PathResult::failure(common::ErrorKind::PermissionDenied,
                             "permission denied: " + path + " is outside the writable roots");
}

} // namespace tutorplane::security
