#include "tutorplane/config/config.hpp"

#include "tutorplane/common/fs.hpp"
#include "tutorplane/common/toml.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string_view>

namespace tutorplane::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".tutorplane";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

constexpr std::array<std::string_view, 21> KNOWN_KEYS = {
    "safety.allowed_actions",
    "safety.max_parameters",
    "safety.writable_roots",
    "safety.shell_whitelist",
    "safety.shell_working_dir",
    "safety.command_timeout_seconds",
    "safety.command_output_chars",
    "sandbox.scratch_dir",
    "sandbox.exec_timeout_seconds",
    "sandbox.compile_timeout_seconds",
    "sandbox.max_output_bytes",
    "sandbox.max_diagnostic_bytes",
    "sandbox.max_memory_mb",
    "storage.database_path",
    "storage.search_top_k",
    "audit.journal_path",
    "web.user_agent",
    "web.timeout_seconds",
    "web.max_content_bytes",
    "web.max_search_results",
    "observability.backend",
};

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("TUTORPLANE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::vector<std::string> expand_all(std::vector<std::string> values) {
  for (auto &value : values) {
    value = expand_config_value(value);
  }
  return values;
}

std::uint32_t get_u32(const common::TomlDocument &doc, const std::string &key,
                      const std::uint32_t fallback) {
  const std::uint64_t value = doc.get_u64(key, fallback);
  if (value > UINT32_MAX) {
    return fallback;
  }
  return static_cast<std::uint32_t>(value);
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *scratch = env_value("TUTORPLANE_SCRATCH_DIR"); scratch != nullptr) {
    config.sandbox.scratch_dir = common::expand_path(scratch);
  }
  if (const char *db = env_value("TUTORPLANE_DB_PATH"); db != nullptr) {
    config.storage.database_path = common::expand_path(db);
  }
  if (const char *journal = env_value("TUTORPLANE_AUDIT_JOURNAL"); journal != nullptr) {
    config.audit.journal_path = common::expand_path(journal);
  }
  if (const char *backend = env_value("TUTORPLANE_OBSERVABILITY"); backend != nullptr) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error_info());
  }
  const auto &doc = parsed.value();

  Config config;

  auto &safety = config.safety;
  safety.allowed_actions = doc.get_string_array("safety.allowed_actions", safety.allowed_actions);
  safety.max_parameters = get_u32(doc, "safety.max_parameters", safety.max_parameters);
  safety.writable_roots =
      expand_all(doc.get_string_array("safety.writable_roots", safety.writable_roots));
  safety.shell_whitelist = doc.get_string_array("safety.shell_whitelist", safety.shell_whitelist);
  safety.shell_working_dir =
      expand_config_value(doc.get_string("safety.shell_working_dir", safety.shell_working_dir));
  safety.command_timeout_seconds =
      get_u32(doc, "safety.command_timeout_seconds", safety.command_timeout_seconds);
  safety.command_output_chars =
      doc.get_u64("safety.command_output_chars", safety.command_output_chars);

  auto &sandbox = config.sandbox;
  sandbox.scratch_dir =
      expand_config_value(doc.get_string("sandbox.scratch_dir", sandbox.scratch_dir));
  sandbox.exec_timeout_seconds =
      get_u32(doc, "sandbox.exec_timeout_seconds", sandbox.exec_timeout_seconds);
  sandbox.compile_timeout_seconds =
      get_u32(doc, "sandbox.compile_timeout_seconds", sandbox.compile_timeout_seconds);
  sandbox.max_output_bytes = doc.get_u64("sandbox.max_output_bytes", sandbox.max_output_bytes);
  sandbox.max_diagnostic_bytes =
      doc.get_u64("sandbox.max_diagnostic_bytes", sandbox.max_diagnostic_bytes);
  sandbox.max_memory_mb = doc.get_u64("sandbox.max_memory_mb", sandbox.max_memory_mb);

  config.storage.database_path =
      expand_config_value(doc.get_string("storage.database_path", config.storage.database_path));
  config.storage.search_top_k =
      get_u32(doc, "storage.search_top_k", config.storage.search_top_k);

  config.audit.journal_path =
      expand_config_value(doc.get_string("audit.journal_path", config.audit.journal_path));

  auto &web = config.web;
  web.user_agent = doc.get_string("web.user_agent", web.user_agent);
  web.timeout_seconds = get_u32(doc, "web.timeout_seconds", web.timeout_seconds);
  web.max_content_bytes = doc.get_u64("web.max_content_bytes", web.max_content_bytes);
  web.max_search_results = get_u32(doc, "web.max_search_results", web.max_search_results);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  for (const auto &key : doc.keys()) {
    if (std::find(KNOWN_KEYS.begin(), KNOWN_KEYS.end(), key) == KNOWN_KEYS.end()) {
      config.unknown_keys.push_back(key);
    }
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto text = common::read_text_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(text.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error_kind(),
                                           path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[safety]\n";
  out << "allowed_actions = " << common::toml_string_array(config.safety.allowed_actions) << "\n";
  out << "max_parameters = " << config.safety.max_parameters << "\n";
  out << "writable_roots = " << common::toml_string_array(config.safety.writable_roots) << "\n";
  out << "shell_whitelist = " << common::toml_string_array(config.safety.shell_whitelist) << "\n";
  out << "shell_working_dir = " << common::quote_toml_string(config.safety.shell_working_dir)
      << "\n";
  out << "command_timeout_seconds = " << config.safety.command_timeout_seconds << "\n";
  out << "command_output_chars = " << config.safety.command_output_chars << "\n";

  out << "\n[sandbox]\n";
  out << "scratch_dir = " << common::quote_toml_string(config.sandbox.scratch_dir) << "\n";
  out << "exec_timeout_seconds = " << config.sandbox.exec_timeout_seconds << "\n";
  out << "compile_timeout_seconds = " << config.sandbox.compile_timeout_seconds << "\n";
  out << "max_output_bytes = " << config.sandbox.max_output_bytes << "\n";
  out << "max_diagnostic_bytes = " << config.sandbox.max_diagnostic_bytes << "\n";
  out << "max_memory_mb = " << config.sandbox.max_memory_mb << "\n";

  out << "\n[storage]\n";
  out << "database_path = " << common::quote_toml_string(config.storage.database_path) << "\n";
  out << "search_top_k = " << config.storage.search_top_k << "\n";

  out << "\n[audit]\n";
  out << "journal_path = " << common::quote_toml_string(config.audit.journal_path) << "\n";

  out << "\n[web]\n";
  out << "user_agent = " << common::quote_toml_string(config.web.user_agent) << "\n";
  out << "timeout_seconds = " << config.web.timeout_seconds << "\n";
  out << "max_content_bytes = " << config.web.max_content_bytes << "\n";
  out << "max_search_results = " << config.web.max_search_results << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.safety.allowed_actions.empty()) {
    return ValidationResult::failure(common::ErrorKind::InvalidArguments,
                                     "safety.allowed_actions must not be empty");
  }
  if (config.safety.max_parameters == 0) {
    return ValidationResult::failure(common::ErrorKind::InvalidArguments,
                                     "safety.max_parameters must be at least 1");
  }
  for (const auto &root : config.safety.writable_roots) {
    if (!std::filesystem::path(root).is_absolute()) {
      return ValidationResult::failure(common::ErrorKind::InvalidArguments,
                                       "safety.writable_roots entries must be absolute: " + root);
    }
  }
  for (const auto &command : config.safety.shell_whitelist) {
    if (command.empty() || command.find('/') != std::string::npos ||
        command.find_first_of(" \t") != std::string::npos) {
      return ValidationResult::failure(common::ErrorKind::InvalidArguments,
                                       "safety.shell_whitelist entries must be bare command "
                                       "names: '" + command + "'");
    }
  }

  if (config.sandbox.exec_timeout_seconds == 0 || config.sandbox.compile_timeout_seconds == 0) {
    return ValidationResult::failure(common::ErrorKind::InvalidArguments,
                                     "sandbox timeouts must be at least 1 second");
  }
  if (config.sandbox.max_output_bytes == 0) {
    return ValidationResult::failure(common::ErrorKind::InvalidArguments,
                                     "sandbox.max_output_bytes must be positive");
  }
  if (!config.sandbox.scratch_dir.empty()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(config.sandbox.scratch_dir, ec)) {
      warnings.push_back("sandbox.scratch_dir does not exist yet: " + config.sandbox.scratch_dir);
    }
  }
  if (config.sandbox.exec_timeout_seconds > config.sandbox.compile_timeout_seconds) {
    warnings.push_back("sandbox.exec_timeout_seconds exceeds compile_timeout_seconds");
  }

  if (config.storage.database_path.empty()) {
    return ValidationResult::failure(common::ErrorKind::InvalidArguments,
                                     "storage.database_path must not be empty");
  }
  if (config.storage.search_top_k == 0) {
    warnings.push_back("storage.search_top_k is 0; knowledge search will return nothing");
  }

  if (config.web.timeout_seconds == 0) {
    return ValidationResult::failure(common::ErrorKind::InvalidArguments,
                                     "web.timeout_seconds must be at least 1");
  }

  std::stringstream backends(config.observability.backend);
  std::string part;
  while (std::getline(backends, part, ',')) {
    const std::string backend = common::to_lower(common::trim(part));
    if (backend != "log" && backend != "none" && backend != "noop" && !backend.empty()) {
      return ValidationResult::failure(common::ErrorKind::InvalidArguments,
                                       "Invalid observability.backend: " +
                                           config.observability.backend);
    }
  }

  for (const auto &key : config.unknown_keys) {
    warnings.push_back("unknown config key: " + key);
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace tutorplane::config
