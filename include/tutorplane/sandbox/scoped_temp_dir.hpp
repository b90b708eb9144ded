#pragma once

#include "tutorplane/common/result.hpp"

#include <filesystem>
#include <string>

namespace tutorplane::sandbox {

/// Owns a mkdtemp directory. remove() reports failures; the destructor is the
/// fallback for paths that never reach it.
class ScopedTempDir {
public:
  ScopedTempDir() = default;
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;
  ScopedTempDir(ScopedTempDir &&other) noexcept;
  ScopedTempDir &operator=(ScopedTempDir &&other) noexcept;

  [[nodiscard]] common::Status create(const std::filesystem::path &parent,
                                      const std::string &prefix);
  [[nodiscard]] common::Status remove();

  /// Creates an empty file with a unique name and the given suffix.
  [[nodiscard]] common::Result<std::filesystem::path> create_file(const std::string &stem,
                                                                  const std::string &suffix);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] bool active() const { return !path_.empty(); }

private:
  std::filesystem::path path_;
};

} // namespace tutorplane::sandbox
