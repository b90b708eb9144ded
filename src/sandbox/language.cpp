#include "tutorplane/sandbox/language.hpp"

#include "tutorplane/common/fs.hpp"

namespace tutorplane::sandbox {

const std::array<LanguageProfile, 6> &language_profiles() {
  static const std::array<LanguageProfile, 6> profiles = {
      LanguageProfile{.language = Language::Python,
                      .name = "python",
                      .aliases = {"py", "python3"},
                      .source_extension = ".py",
                      .compile_command = {},
                      .run_command = {"python3", "{source}"}},
      LanguageProfile{.language = Language::JavaScript,
                      .name = "javascript",
                      .aliases = {"js", "node", "nodejs"},
                      .source_extension = ".js",
                      .compile_command = {},
                      .run_command = {"node", "{source}"}},
      LanguageProfile{.language = Language::Go,
                      .name = "go",
                      .aliases = {"golang"},
                      .source_extension = ".go",
                      .compile_command = {},
                      .run_command = {"go", "run", "{source}"}},
      LanguageProfile{.language = Language::Rust,
                      .name = "rust",
                      .aliases = {"rs"},
                      .source_extension = ".rs",
                      .compile_command = {"rustc", "{source}", "-o", "{binary}"},
                      .run_command = {"{binary}"}},
      LanguageProfile{.language = Language::C,
                      .name = "c",
                      .aliases = {},
                      .source_extension = ".c",
                      .compile_command = {"gcc", "{source}", "-o", "{binary}", "-lm"},
                      .run_command = {"{binary}"}},
      LanguageProfile{.language = Language::Cpp,
                      .name = "cpp",
                      .aliases = {"c++", "cxx"},
                      .source_extension = ".cpp",
                      .compile_command = {"g++", "{source}", "-o", "{binary}"},
                      .run_command = {"{binary}"}},
  };
  return profiles;
}

const LanguageProfile *find_language(const std::string_view name) {
  const std::string wanted = common::to_lower(common::trim(std::string(name)));
  if (wanted.empty()) {
    return nullptr;
  }
  for (const auto &profile : language_profiles()) {
    if (profile.name == wanted) {
      return &profile;
    }
    for (const auto alias : profile.aliases) {
      if (alias == wanted) {
        return &profile;
      }
    }
  }
  return nullptr;
}

std::string supported_language_names() {
  std::string out;
  for (const auto &profile : language_profiles()) {
    if (!out.empty()) {
      out += ", ";
    }
    out += profile.name;
  }
  return out;
}

std::vector<std::string> expand_command(const std::vector<std::string_view> &command_template,
                                        const std::string &source, const std::string &binary) {
  std::vector<std::string> argv;
  argv.reserve(command_template.size());
  for (const auto part : command_template) {
    if (part == "{source}") {
      argv.push_back(source);
    } else if (part == "{binary}") {
      argv.push_back(binary);
    } else {
      argv.emplace_back(part);
    }
  }
  return argv;
}

} // namespace tutorplane::sandbox
