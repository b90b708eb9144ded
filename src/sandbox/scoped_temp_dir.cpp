#include "tutorplane/sandbox/scoped_temp_dir.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <utility>
#include <vector>

namespace tutorplane::sandbox {

ScopedTempDir::~ScopedTempDir() {
  if (active()) {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
}

ScopedTempDir::ScopedTempDir(ScopedTempDir &&other) noexcept
    : path_(std::exchange(other.path_, {})) {}

ScopedTempDir &ScopedTempDir::operator=(ScopedTempDir &&other) noexcept {
  if (this != &other) {
    if (active()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
    path_ = std::exchange(other.path_, {});
  }
  return *this;
}

common::Status ScopedTempDir::create(const std::filesystem::path &parent,
                                     const std::string &prefix) {
  if (active()) {
    return common::Status::error("temporary directory already created: " + path_.string());
  }

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    return common::Status::error("cannot create scratch directory " + parent.string() + ": " +
                                 ec.message());
  }

  std::string pattern = (parent / (prefix + "XXXXXX")).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  if (mkdtemp(buffer.data()) == nullptr) {
    return common::Status::error("mkdtemp failed in " + parent.string() + ": " +
                                 std::strerror(errno));
  }
  path_ = std::filesystem::path(buffer.data());
  return common::Status::success();
}

common::Status ScopedTempDir::remove() {
  if (!active()) {
    return common::Status::success();
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    return common::Status::error("failed to remove " + path_.string() + ": " + ec.message());
  }
  path_.clear();
  return common::Status::success();
}

common::Result<std::filesystem::path> ScopedTempDir::create_file(const std::string &stem,
                                                                 const std::string &suffix) {
  if (!active()) {
    return common::Result<std::filesystem::path>::failure("temporary directory not created");
  }

  const std::string pattern = (path_ / (stem + "_XXXXXX" + suffix)).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  const int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    return common::Result<std::filesystem::path>::failure("mkstemps failed in " + path_.string() +
                                                          ": " + std::strerror(errno));
  }
  close(fd);
  return common::Result<std::filesystem::path>::success(std::filesystem::path(buffer.data()));
}

} // namespace tutorplane::sandbox
