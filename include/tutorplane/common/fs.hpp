#pragma once

#include "tutorplane/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tutorplane::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string join(const std::vector<std::string> &values, const std::string &sep);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);
[[nodiscard]] bool looks_binary(const std::filesystem::path &path);
[[nodiscard]] std::string utc_timestamp();
/// Drops a trailing incomplete UTF-8 sequence, such as one cut by a byte cap.
void utf8_trim_partial_tail(std::string &text);

} // namespace tutorplane::common
