#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tutorplane::sandbox {

enum class Language { Python, JavaScript, Go, Rust, C, Cpp };

/// Command templates substitute "{source}" and "{binary}" per argument.
struct LanguageProfile {
  Language language;
  std::string_view name;
  std::vector<std::string_view> aliases;
  std::string_view source_extension;
  std::vector<std::string_view> compile_command;
  std::vector<std::string_view> run_command;

  [[nodiscard]] bool compiled() const { return !compile_command.empty(); }
};

[[nodiscard]] const std::array<LanguageProfile, 6> &language_profiles();

/// Case-insensitive lookup by name or alias ("py", "js", "c++", ...).
[[nodiscard]] const LanguageProfile *find_language(std::string_view name);

[[nodiscard]] std::string supported_language_names();

[[nodiscard]] std::vector<std::string>
expand_command(const std::vector<std::string_view> &command_template, const std::string &source,
               const std::string &binary);

} // namespace tutorplane::sandbox
