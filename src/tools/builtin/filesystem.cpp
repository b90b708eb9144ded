#include "tutorplane/tools/builtin/filesystem.hpp"

#include "tutorplane/common/fs.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace tutorplane::tools {

namespace {

// Byte length of the first `max_chars` UTF-8 code points.
std::size_t utf8_prefix_bytes(const std::string &text, const std::size_t max_chars) {
  std::size_t chars = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto byte = static_cast<unsigned char>(text[i]);
    if ((byte & 0xC0U) != 0x80U) {
      if (chars == max_chars) {
        return i;
      }
      ++chars;
    }
  }
  return text.size();
}

common::ErrorKind kind_for(const std::error_code &ec) {
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return common::ErrorKind::PermissionDenied;
  }
  if (ec == std::errc::no_such_file_or_directory) {
    return common::ErrorKind::NotFound;
  }
  return common::ErrorKind::InternalError;
}

// Unique per call and in the target's directory, so the rename never crosses
// filesystems.
common::Result<std::filesystem::path> create_sibling_temp(const std::filesystem::path &target) {
  const std::string pattern =
      (target.parent_path() / ("." + target.filename().string() + ".XXXXXX")).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  const int fd = mkstemp(buffer.data());
  if (fd < 0) {
    const std::error_code ec(errno, std::generic_category());
    return common::Result<std::filesystem::path>::failure(
        kind_for(ec), "failed to create temporary file for " + target.string() + ": " +
                          ec.message());
  }
  (void)fchmod(fd, 0644);
  close(fd);
  return common::Result<std::filesystem::path>::success(std::filesystem::path(buffer.data()));
}

} // namespace

// read_file

std::string_view ReadFileTool::description() const {
  return "Read a UTF-8 text file, truncated after 5000 characters";
}

std::string ReadFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"}}})";
}

common::Result<ToolResult> ReadFileTool::execute(const ToolArgs &args, const ToolContext &) {
  auto path_arg = required_arg(args, "path");
  if (!path_arg.ok()) {
    return common::Result<ToolResult>::failure(path_arg.error_info());
  }
  const std::filesystem::path path = path_arg.value();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::NotFound,
                                               "file not found: " + path.string());
  }
  if (common::looks_binary(path)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::InvalidArguments,
                                               "binary file read is not allowed: " +
                                                   path.string());
  }

  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<ToolResult>::failure(content.error_info());
  }

  std::string text = std::move(content.value());
  const std::size_t keep = utf8_prefix_bytes(text, kReadFileMaxChars);
  const bool truncated = keep < text.size();
  if (truncated) {
    text.resize(keep);
    text += "... (truncated)";
  }

  ToolResult result = make_result();
  result.set_string("path", path.string());
  result.set_string("content", text);
  result.set_bool("truncated", truncated);
  return common::Result<ToolResult>::success(std::move(result));
}

// list_directory

std::string_view ListDirectoryTool::description() const {
  return "List the entry names of a directory";
}

std::string ListDirectoryTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"}}})";
}

common::Result<ToolResult> ListDirectoryTool::execute(const ToolArgs &args, const ToolContext &) {
  auto path_arg = required_arg(args, "path");
  if (!path_arg.ok()) {
    return common::Result<ToolResult>::failure(path_arg.error_info());
  }
  const std::filesystem::path path = path_arg.value();

  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::NotFound,
                                               "directory not found: " + path.string());
  }

  std::vector<std::string> items;
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return common::Result<ToolResult>::failure(kind_for(ec), "failed to list directory " +
                                                                 path.string() + ": " +
                                                                 ec.message());
  }
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    items.push_back(it->path().filename().string());
  }
  if (ec) {
    return common::Result<ToolResult>::failure(kind_for(ec), "failed to list directory " +
                                                                 path.string() + ": " +
                                                                 ec.message());
  }
  std::sort(items.begin(), items.end());

  ToolResult result = make_result();
  result.set_string("path", path.string());
  result.set_raw("items", common::json_string_array(items));
  result.set_int("count", static_cast<std::int64_t>(items.size()));
  return common::Result<ToolResult>::success(std::move(result));
}

// write_file

WriteFileTool::WriteFileTool(std::shared_ptr<const security::SafetyPolicy> policy)
    : policy_(std::move(policy)) {}

std::string_view WriteFileTool::description() const {
  return "Write content to a file inside the writable roots atomically";
}

std::string WriteFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path","content"],"properties":{"path":{"type":"string"},"content":{"type":"string"}}})";
}

common::Result<ToolResult> WriteFileTool::execute(const ToolArgs &args, const ToolContext &) {
  if (!policy_) {
    return common::Result<ToolResult>::failure("safety policy unavailable");
  }

  auto path_arg = required_arg(args, "path");
  if (!path_arg.ok()) {
    return common::Result<ToolResult>::failure(path_arg.error_info());
  }
  // Empty content is a valid write.
  const auto content_it = args.find("content");
  if (content_it == args.end()) {
    return common::Result<ToolResult>::failure(common::ErrorKind::InvalidArguments,
                                               "missing required parameter: content");
  }

  auto validated = policy_->check_writable(path_arg.value());
  if (!validated.ok()) {
    return common::Result<ToolResult>::failure(validated.error_info());
  }
  const std::filesystem::path target = validated.value();

  std::error_code ec;
  if (std::filesystem::is_directory(target, ec)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::InvalidArguments,
                                               "path is a directory: " + target.string());
  }
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    return common::Result<ToolResult>::failure(kind_for(ec), "failed to create parent directory: " +
                                                                 ec.message());
  }

  auto temp_file = create_sibling_temp(target);
  if (!temp_file.ok()) {
    return common::Result<ToolResult>::failure(temp_file.error_info());
  }
  const std::filesystem::path temp_path = temp_file.value();
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      std::filesystem::remove(temp_path, ec);
      return common::Result<ToolResult>::failure(common::ErrorKind::PermissionDenied,
                                                 "failed to open temporary file for " +
                                                     target.string());
    }
    out << content_it->second;
    out.close();
    if (!out) {
      std::filesystem::remove(temp_path, ec);
      return common::Result<ToolResult>::failure("failed to write " + target.string());
    }
  }

  std::filesystem::rename(temp_path, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return common::Result<ToolResult>::failure("failed to atomically replace file: " +
                                               ec.message());
  }

  ToolResult result = make_result();
  result.set_string("path", target.string());
  result.set_int("bytes_written", static_cast<std::int64_t>(content_it->second.size()));
  return common::Result<ToolResult>::success(std::move(result));
}

// delete_file

DeleteFileTool::DeleteFileTool(std::shared_ptr<const security::SafetyPolicy> policy)
    : policy_(std::move(policy)) {}

std::string_view DeleteFileTool::description() const {
  return "Delete a regular file inside the writable roots";
}

std::string DeleteFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"}}})";
}

common::Result<ToolResult> DeleteFileTool::execute(const ToolArgs &args, const ToolContext &) {
  if (!policy_) {
    return common::Result<ToolResult>::failure("safety policy unavailable");
  }

  auto path_arg = required_arg(args, "path");
  if (!path_arg.ok()) {
    return common::Result<ToolResult>::failure(path_arg.error_info());
  }

  auto validated = policy_->check_writable(path_arg.value());
  if (!validated.ok()) {
    return common::Result<ToolResult>::failure(validated.error_info());
  }
  const std::filesystem::path target = validated.value();

  std::error_code ec;
  const auto status = std::filesystem::symlink_status(target, ec);
  if (ec || !std::filesystem::exists(status)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::NotFound,
                                               "file not found: " + path_arg.value());
  }
  if (!std::filesystem::is_regular_file(status)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::InvalidArguments,
                                               "not a regular file: " + target.string());
  }

  if (!std::filesystem::remove(target, ec) || ec) {
    return common::Result<ToolResult>::failure(kind_for(ec), "failed to delete " +
                                                                 target.string() + ": " +
                                                                 ec.message());
  }

  ToolResult result = make_result();
  result.set_string("path", target.string());
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace tutorplane::tools
