#pragma once

#include "tutorplane/common/result.hpp"
#include "tutorplane/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tutorplane::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Reads the config file (a missing file yields defaults) and applies the
/// TUTORPLANE_* environment overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Config rendered back to TOML, as `tutorplane config` prints it.
[[nodiscard]] std::string render_config(const Config &config);

/// Returns warnings for questionable but usable settings, or an error.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace tutorplane::config
