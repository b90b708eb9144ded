#pragma once

#include "tutorplane/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sqlite3.h>
#include <vector>

namespace tutorplane::store {

struct LearnerProfile {
  std::string proficiency = "fundamental";
  std::vector<std::string> topics_covered;
};

struct InteractionRecord {
  std::int64_t id = 0;
  std::string timestamp;
  std::string event;
  std::string details_json;
};

using DocumentMetadata = std::map<std::string, std::string>;

struct KnowledgeDocument {
  std::string doc_id;
  std::string content;
  DocumentMetadata metadata;
  std::string created_at;
};

struct KnowledgeHit {
  KnowledgeDocument document;
  double score = 0.0;
};

class ITutorStore {
public:
  virtual ~ITutorStore() = default;

  [[nodiscard]] virtual common::Result<LearnerProfile> profile() = 0;
  /// Empty optionals leave the field unchanged; a topic is appended once.
  [[nodiscard]] virtual common::Result<LearnerProfile>
  update_profile(const std::optional<std::string> &proficiency,
                 const std::optional<std::string> &topic) = 0;

  [[nodiscard]] virtual common::Result<std::int64_t>
  log_interaction(const std::string &event, const std::string &details_json) = 0;
  [[nodiscard]] virtual common::Result<std::vector<InteractionRecord>>
  recent_interactions(std::size_t limit) = 0;

  /// Inserts or replaces by doc_id.
  [[nodiscard]] virtual common::Status add_document(const KnowledgeDocument &document) = 0;
  /// Keyword search. Every filter entry must equal the document's metadata value.
  [[nodiscard]] virtual common::Result<std::vector<KnowledgeHit>>
  search(const std::string &query, const DocumentMetadata &filters, std::size_t top_k) = 0;
  [[nodiscard]] virtual common::Result<std::size_t> document_count() = 0;
};

class SqliteTutorStore final : public ITutorStore {
public:
  /// ":memory:" opens a private in-memory database.
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteTutorStore>>
  open(const std::filesystem::path &db_path);
  ~SqliteTutorStore() override;

  SqliteTutorStore(const SqliteTutorStore &) = delete;
  SqliteTutorStore &operator=(const SqliteTutorStore &) = delete;

  [[nodiscard]] common::Result<LearnerProfile> profile() override;
  [[nodiscard]] common::Result<LearnerProfile>
  update_profile(const std::optional<std::string> &proficiency,
                 const std::optional<std::string> &topic) override;
  [[nodiscard]] common::Result<std::int64_t> log_interaction(const std::string &event,
                                                             const std::string &details_json) override;
  [[nodiscard]] common::Result<std::vector<InteractionRecord>>
  recent_interactions(std::size_t limit) override;
  [[nodiscard]] common::Status add_document(const KnowledgeDocument &document) override;
  [[nodiscard]] common::Result<std::vector<KnowledgeHit>>
  search(const std::string &query, const DocumentMetadata &filters, std::size_t top_k) override;
  [[nodiscard]] common::Result<std::size_t> document_count() override;

private:
  explicit SqliteTutorStore(sqlite3 *db);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<LearnerProfile> load_profile_locked();

  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

/// FTS5 MATCH expression: each word quoted, joined with OR. Empty when the
/// query has no searchable words.
[[nodiscard]] std::string build_fts_query(const std::string &query);

} // namespace tutorplane::store
