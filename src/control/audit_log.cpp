#include "tutorplane/control/audit_log.hpp"

#include "tutorplane/common/fs.hpp"
#include "tutorplane/common/hash.hpp"
#include "tutorplane/common/json_util.hpp"
#include "tutorplane/observability/global.hpp"

#include <fstream>

namespace tutorplane::control {

namespace {

common::JsonFields body_fields(const AuditEntry &entry) {
  return {
      {"sequence", std::to_string(entry.sequence)},
      {"timestamp", common::json_quote(entry.timestamp)},
      {"action", common::json_quote(entry.action)},
      {"plan", entry.plan.to_json()},
      {"result", entry.result_json.empty() ? "null" : entry.result_json},
      {"previous_digest", common::json_quote(entry.previous_digest)},
  };
}

} // namespace

std::string AuditEntry::body_json() const { return common::json_object(body_fields(*this)); }

std::string AuditEntry::to_json() const {
  auto fields = body_fields(*this);
  fields.emplace_back("digest", common::json_quote(digest));
  return common::json_object(fields);
}

AuditLog::AuditLog(std::filesystem::path journal_path) : journal_path_(std::move(journal_path)) {}

const std::string &AuditLog::genesis_digest() {
  static const std::string genesis(64, '0');
  return genesis;
}

std::uint64_t AuditLog::append(const ActionPlan &plan, const std::string &action,
                               const std::string &result_json) {
  std::lock_guard<std::mutex> lock(mutex_);
  AuditEntry entry;
  entry.sequence = static_cast<std::uint64_t>(entries_.size()) + 1;
  entry.timestamp = common::utc_timestamp();
  entry.plan = plan;
  entry.action = action;
  entry.result_json = result_json;
  entry.previous_digest = entries_.empty() ? genesis_digest() : entries_.back().digest;
  entry.digest = common::sha256_hex(entry.body_json());

  write_journal_locked(entry);
  entries_.push_back(std::move(entry));
  return static_cast<std::uint64_t>(entries_.size());
}

// A journal failure is reported and the in-memory entry still counts.
void AuditLog::write_journal_locked(const AuditEntry &entry) {
  if (journal_path_.empty()) {
    return;
  }
  if (journal_path_.has_parent_path()) {
    if (const auto dir = common::ensure_dir(journal_path_.parent_path()); !dir.ok()) {
      observability::record_error("audit", dir.error());
      return;
    }
  }
  std::ofstream out(journal_path_, std::ios::app);
  if (!out) {
    observability::record_error("audit", "cannot open audit journal " + journal_path_.string());
    return;
  }
  out << entry.to_json() << '\n';
  out.flush();
  if (!out) {
    observability::record_error("audit", "failed to write audit journal " + journal_path_.string());
  }
}

std::uint64_t AuditLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::uint64_t>(entries_.size());
}

std::vector<AuditEntry> AuditLog::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

std::string AuditLog::head_digest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.empty() ? genesis_digest() : entries_.back().digest;
}

common::Status AuditLog::verify() const { return verify_chain(entries()); }

common::Status AuditLog::verify_chain(const std::vector<AuditEntry> &entries) {
  std::string expected_previous = genesis_digest();
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const AuditEntry &entry = entries[i];
    const std::string where = "audit entry " + std::to_string(i + 1);
    if (entry.sequence != i + 1) {
      return common::Status::error(where + ": sequence out of order");
    }
    if (entry.previous_digest != expected_previous) {
      return common::Status::error(where + ": chain link broken");
    }
    if (common::sha256_hex(entry.body_json()) != entry.digest) {
      return common::Status::error(where + ": digest mismatch");
    }
    expected_previous = entry.digest;
  }
  return common::Status::success();
}

} // namespace tutorplane::control
