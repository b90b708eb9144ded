#include "tutorplane/store/tutor_store.hpp"

#include "tutorplane/common/fs.hpp"
#include "tutorplane/common/json_util.hpp"

#include <algorithm>
#include <cctype>

namespace tutorplane::store {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::string column_string(sqlite3_stmt *stmt, const int index) {
  const auto *text = sqlite3_column_text(stmt, index);
  if (text == nullptr) {
    return "";
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

DocumentMetadata parse_metadata(const std::string &json) {
  auto parsed = common::json_parse_flat(json);
  if (!parsed.ok()) {
    return {};
  }
  return std::move(parsed.value());
}

bool matches_filters(const DocumentMetadata &metadata, const DocumentMetadata &filters) {
  return std::all_of(filters.begin(), filters.end(), [&metadata](const auto &filter) {
    const auto it = metadata.find(filter.first);
    return it != metadata.end() && it->second == filter.second;
  });
}

const char *const SCHEMA_SQL = R"(
CREATE TABLE IF NOT EXISTS user_profiles (
  id INTEGER PRIMARY KEY CHECK (id = 1),
  proficiency TEXT NOT NULL DEFAULT 'fundamental',
  topics_covered TEXT NOT NULL DEFAULT '[]'
);
INSERT OR IGNORE INTO user_profiles(id) VALUES (1);

CREATE TABLE IF NOT EXISTS interaction_logs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  timestamp TEXT NOT NULL,
  event TEXT NOT NULL,
  details TEXT NOT NULL DEFAULT '{}'
);

CREATE TABLE IF NOT EXISTS knowledge_documents (
  doc_id TEXT PRIMARY KEY,
  content TEXT NOT NULL,
  metadata TEXT NOT NULL DEFAULT '{}',
  created_at TEXT NOT NULL
);

CREATE VIRTUAL TABLE IF NOT EXISTS knowledge_fts USING fts5(
  content,
  content=knowledge_documents, content_rowid=rowid
);

CREATE TRIGGER IF NOT EXISTS knowledge_ai AFTER INSERT ON knowledge_documents BEGIN
  INSERT INTO knowledge_fts(rowid, content) VALUES (new.rowid, new.content);
END;

CREATE TRIGGER IF NOT EXISTS knowledge_ad AFTER DELETE ON knowledge_documents BEGIN
  INSERT INTO knowledge_fts(knowledge_fts, rowid, content) VALUES ('delete', old.rowid, old.content);
END;

CREATE TRIGGER IF NOT EXISTS knowledge_au AFTER UPDATE ON knowledge_documents BEGIN
  INSERT INTO knowledge_fts(knowledge_fts, rowid, content) VALUES ('delete', old.rowid, old.content);
  INSERT INTO knowledge_fts(rowid, content) VALUES (new.rowid, new.content);
END;
)";

} // namespace

std::string build_fts_query(const std::string &query) {
  std::vector<std::string> words;
  std::string current;
  for (const char ch : query) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0 || ch == '_' || uch >= 0x80) {
      current.push_back(ch);
      continue;
    }
    if (!current.empty()) {
      words.push_back("\"" + current + "\"");
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back("\"" + current + "\"");
  }
  return common::join(words, " OR ");
}

SqliteTutorStore::SqliteTutorStore(sqlite3 *db) : db_(db) {}

SqliteTutorStore::~SqliteTutorStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Result<std::unique_ptr<SqliteTutorStore>>
SqliteTutorStore::open(const std::filesystem::path &db_path) {
  using OpenResult = common::Result<std::unique_ptr<SqliteTutorStore>>;
  const bool in_memory = db_path.string() == ":memory:";
  if (!in_memory && db_path.has_parent_path()) {
    if (auto dir = common::ensure_dir(db_path.parent_path()); !dir.ok()) {
      return OpenResult::failure(dir.error());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
    const std::string message =
        db == nullptr ? std::string("out of memory") : std::string(sqlite3_errmsg(db));
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return OpenResult::failure("cannot open database " + db_path.string() + ": " + message);
  }

  std::unique_ptr<SqliteTutorStore> store(new SqliteTutorStore(db));
  sqlite3_busy_timeout(db, 5000);
  if (!in_memory) {
    if (auto wal = exec_sql(db, "PRAGMA journal_mode=WAL;"); !wal.ok()) {
      return OpenResult::failure(wal.error());
    }
  }
  if (auto schema = store->init_schema(); !schema.ok()) {
    return OpenResult::failure("schema initialization failed: " + schema.error());
  }
  return OpenResult::success(std::move(store));
}

common::Status SqliteTutorStore::init_schema() { return exec_sql(db_, SCHEMA_SQL); }

common::Result<LearnerProfile> SqliteTutorStore::load_profile_locked() {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT proficiency, topics_covered FROM user_profiles WHERE id = 1",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<LearnerProfile>::failure(sqlite3_errmsg(db_));
  }

  LearnerProfile profile;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    profile.proficiency = column_string(stmt, 0);
    // A corrupt topic list reads as empty rather than failing the profile.
    if (auto topics = common::json_parse_string_array(column_string(stmt, 1)); topics.ok()) {
      profile.topics_covered = std::move(topics.value());
    }
  }
  sqlite3_finalize(stmt);
  return common::Result<LearnerProfile>::success(std::move(profile));
}

common::Result<LearnerProfile> SqliteTutorStore::profile() {
  std::lock_guard<std::mutex> lock(mutex_);
  return load_profile_locked();
}

common::Result<LearnerProfile>
SqliteTutorStore::update_profile(const std::optional<std::string> &proficiency,
                                 const std::optional<std::string> &topic) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto loaded = load_profile_locked();
  if (!loaded.ok()) {
    return loaded;
  }

  LearnerProfile profile = std::move(loaded.value());
  if (proficiency.has_value() && !proficiency->empty()) {
    profile.proficiency = *proficiency;
  }
  if (topic.has_value() && !topic->empty() &&
      std::find(profile.topics_covered.begin(), profile.topics_covered.end(), *topic) ==
          profile.topics_covered.end()) {
    profile.topics_covered.push_back(*topic);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "UPDATE user_profiles SET proficiency = ?1, topics_covered = ?2 WHERE id = 1",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<LearnerProfile>::failure(sqlite3_errmsg(db_));
  }
  const std::string topics_json = common::json_string_array(profile.topics_covered);
  sqlite3_bind_text(stmt, 1, profile.proficiency.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, topics_json.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<LearnerProfile>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<LearnerProfile>::success(std::move(profile));
}

common::Result<std::int64_t> SqliteTutorStore::log_interaction(const std::string &event,
                                                               const std::string &details_json) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "INSERT INTO interaction_logs(timestamp, event, details) VALUES(?1, ?2, ?3)",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::int64_t>::failure(sqlite3_errmsg(db_));
  }
  const std::string now = common::utc_timestamp();
  sqlite3_bind_text(stmt, 1, now.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, event.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, details_json.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::int64_t>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::int64_t>::success(
      static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_)));
}

common::Result<std::vector<InteractionRecord>>
SqliteTutorStore::recent_interactions(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(
          db_, "SELECT id, timestamp, event, details FROM interaction_logs ORDER BY id DESC LIMIT ?1",
          -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<InteractionRecord>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

  std::vector<InteractionRecord> records;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    records.push_back(InteractionRecord{.id = sqlite3_column_int64(stmt, 0),
                                        .timestamp = column_string(stmt, 1),
                                        .event = column_string(stmt, 2),
                                        .details_json = column_string(stmt, 3)});
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<InteractionRecord>>::success(std::move(records));
}

common::Status SqliteTutorStore::add_document(const KnowledgeDocument &document) {
  if (document.doc_id.empty()) {
    return common::Status::error(common::ErrorKind::InvalidArguments, "document id is empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO knowledge_documents(doc_id, content, metadata, created_at) VALUES(?1, ?2, ?3, ?4)
ON CONFLICT(doc_id) DO UPDATE SET content = excluded.content, metadata = excluded.metadata
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::string metadata = common::json_string_object(document.metadata);
  const std::string created_at =
      document.created_at.empty() ? common::utc_timestamp() : document.created_at;
  sqlite3_bind_text(stmt, 1, document.doc_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, document.content.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, metadata.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, created_at.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<KnowledgeHit>>
SqliteTutorStore::search(const std::string &query, const DocumentMetadata &filters,
                         const std::size_t top_k) {
  const std::string match = build_fts_query(query);
  if (match.empty() || top_k == 0) {
    return common::Result<std::vector<KnowledgeHit>>::success({});
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
SELECT d.doc_id, d.content, d.metadata, d.created_at, bm25(knowledge_fts)
FROM knowledge_fts JOIN knowledge_documents d ON d.rowid = knowledge_fts.rowid
WHERE knowledge_fts MATCH ?1
ORDER BY bm25(knowledge_fts)
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<KnowledgeHit>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, match.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<KnowledgeHit> hits;
  int rc = SQLITE_ROW;
  while (hits.size() < top_k && (rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    KnowledgeDocument document{.doc_id = column_string(stmt, 0),
                               .content = column_string(stmt, 1),
                               .metadata = parse_metadata(column_string(stmt, 2)),
                               .created_at = column_string(stmt, 3)};
    if (!matches_filters(document.metadata, filters)) {
      continue;
    }
    // bm25() is negative, lower is better
    hits.push_back(KnowledgeHit{.document = std::move(document),
                                .score = -sqlite3_column_double(stmt, 4)});
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return common::Result<std::vector<KnowledgeHit>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<KnowledgeHit>>::success(std::move(hits));
}

common::Result<std::size_t> SqliteTutorStore::document_count() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM knowledge_documents", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  std::size_t count = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(count);
}

} // namespace tutorplane::store
