#pragma once

#include "tutorplane/common/result.hpp"
#include "tutorplane/control/action_plan.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace tutorplane::control {

struct AuditEntry {
  std::uint64_t sequence = 0;
  std::string timestamp;
  ActionPlan plan;
  std::string action;
  /// ToolResult JSON as returned to the caller.
  std::string result_json;
  std::string previous_digest;
  std::string digest;

  /// Everything except `digest`; the digest covers exactly this text.
  [[nodiscard]] std::string body_json() const;
  [[nodiscard]] std::string to_json() const;
};

/// Append-only record of every routed execution. Each entry's digest is the
/// SHA-256 of its body, and each body names the previous digest.
class AuditLog {
public:
  /// An empty journal path keeps the log in memory only.
  explicit AuditLog(std::filesystem::path journal_path = {});

  AuditLog(const AuditLog &) = delete;
  AuditLog &operator=(const AuditLog &) = delete;

  /// Returns the log length including the new entry.
  std::uint64_t append(const ActionPlan &plan, const std::string &action,
                       const std::string &result_json);

  [[nodiscard]] std::uint64_t size() const;
  [[nodiscard]] std::vector<AuditEntry> entries() const;
  [[nodiscard]] std::string head_digest() const;
  [[nodiscard]] const std::filesystem::path &journal_path() const { return journal_path_; }

  [[nodiscard]] common::Status verify() const;
  [[nodiscard]] static common::Status verify_chain(const std::vector<AuditEntry> &entries);

  static const std::string &genesis_digest();

private:
  void write_journal_locked(const AuditEntry &entry);

  std::filesystem::path journal_path_;
  mutable std::mutex mutex_;
  std::vector<AuditEntry> entries_;
};

} // namespace tutorplane::control
