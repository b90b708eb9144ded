#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tutorplane/store/tutor_store.hpp"

#include <filesystem>
#include <memory>
#include <thread>

namespace {

std::unique_ptr<tutorplane::store::SqliteTutorStore> open_memory_store() {
  auto opened = tutorplane::store::SqliteTutorStore::open(":memory:");
  tutorplane::tests::require(opened.ok(), opened.ok() ? "" : opened.error());
  return std::move(opened.value());
}

tutorplane::store::KnowledgeDocument document(std::string id, std::string content,
                                              tutorplane::store::DocumentMetadata metadata = {}) {
  return tutorplane::store::KnowledgeDocument{.doc_id = std::move(id),
                                              .content = std::move(content),
                                              .metadata = std::move(metadata),
                                              .created_at = {}};
}

} // namespace

void register_store_tests(std::vector<tutorplane::tests::TestCase> &tests) {
  using tutorplane::tests::require;
  namespace st = tutorplane::store;
  namespace tt = tutorplane::testing;

  tests.push_back({"build_fts_query_quotes_words", [] {
                     require(st::build_fts_query("matrix multiplication") ==
                                 "\"matrix\" OR \"multiplication\"",
                             st::build_fts_query("matrix multiplication"));
                     require(st::build_fts_query("what's \"NEAR\"(x)") ==
                                 "\"what\" OR \"s\" OR \"NEAR\" OR \"x\"",
                             "operators and quotes are stripped");
                     require(st::build_fts_query("  ?!  ").empty(), "no searchable words");
                   }});

  tests.push_back({"profile_starts_fundamental_and_updates", [] {
                     auto store = open_memory_store();
                     auto initial = store->profile();
                     require(initial.ok(), initial.error());
                     require(initial.value().proficiency == "fundamental", "default proficiency");
                     require(initial.value().topics_covered.empty(), "no topics yet");

                     auto updated = store->update_profile("intermediate", "python");
                     require(updated.ok(), updated.error());
                     require(updated.value().proficiency == "intermediate", "proficiency set");

                     auto again = store->update_profile(std::nullopt, "python");
                     require(again.ok(), again.error());
                     require(again.value().topics_covered.size() == 1, "topic recorded once");
                     require(again.value().proficiency == "intermediate", "proficiency kept");

                     auto reread = store->profile();
                     require(reread.ok(), reread.error());
                     require(reread.value().topics_covered.front() == "python", "persisted");
                   }});

  tests.push_back({"interactions_are_returned_newest_first", [] {
                     auto store = open_memory_store();
                     auto first = store->log_interaction("session_start", "{}");
                     auto second = store->log_interaction("quiz", R"({"score":3})");
                     require(first.ok() && second.ok(), "inserts succeed");
                     require(second.value() > first.value(), "ids increase");

                     auto recent = store->recent_interactions(10);
                     require(recent.ok(), recent.error());
                     require(recent.value().size() == 2, "two entries");
                     require(recent.value()[0].event == "quiz", "newest first");
                     require(recent.value()[0].details_json == R"({"score":3})", "details kept");
                     require(!recent.value()[0].timestamp.empty(), "timestamp recorded");

                     auto limited = store->recent_interactions(1);
                     require(limited.ok() && limited.value().size() == 1, "limit honored");
                   }});

  tests.push_back({"search_ranks_matching_documents", [] {
                     auto store = open_memory_store();
                     require(store->add_document(document("d1", "vectors and matrix multiplication")).ok(),
                             "add d1");
                     require(store->add_document(document("d2", "python functions use def")).ok(),
                             "add d2");
                     require(store->add_document(document("d3", "matrix matrix matrix rank")).ok(),
                             "add d3");

                     auto hits = store->search("matrix", {}, 5);
                     require(hits.ok(), hits.error());
                     require(hits.value().size() == 2, "two matrix documents");
                     require(hits.value()[0].document.doc_id == "d3", "denser match ranks first");
                     require(hits.value()[0].score >= hits.value()[1].score, "scores descend");

                     auto capped = store->search("matrix", {}, 1);
                     require(capped.ok() && capped.value().size() == 1, "top_k honored");

                     auto none = store->search("matrix", {}, 0);
                     require(none.ok() && none.value().empty(), "top_k 0 returns nothing");

                     auto junk = store->search("!!!", {}, 3);
                     require(junk.ok() && junk.value().empty(), "no searchable words");
                   }});

  tests.push_back({"search_applies_metadata_filters", [] {
                     auto store = open_memory_store();
                     require(store->add_document(document("a", "recursion basics",
                                                          {{"session_id", "s1"}, {"type", "md"}}))
                                 .ok(),
                             "add a");
                     require(store->add_document(document("b", "recursion advanced",
                                                          {{"session_id", "s2"}, {"type", "md"}}))
                                 .ok(),
                             "add b");

                     auto scoped = store->search("recursion", {{"session_id", "s2"}}, 5);
                     require(scoped.ok(), scoped.error());
                     require(scoped.value().size() == 1, "one match in session s2");
                     require(scoped.value()[0].document.doc_id == "b", "filtered document");
                     require(scoped.value()[0].document.metadata.at("type") == "md",
                             "metadata round-trips");

                     auto missing_key = store->search("recursion", {{"author", "x"}}, 5);
                     require(missing_key.ok() && missing_key.value().empty(),
                             "missing metadata key never matches");
                   }});

  tests.push_back({"add_document_replaces_by_id", [] {
                     auto store = open_memory_store();
                     require(store->add_document(document("doc", "old text about graphs")).ok(), "v1");
                     require(store->add_document(document("doc", "new text about trees")).ok(), "v2");
                     auto count = store->document_count();
                     require(count.ok() && count.value() == 1, "one document");
                     auto old_hits = store->search("graphs", {}, 3);
                     require(old_hits.ok() && old_hits.value().empty(), "old content unindexed");
                     auto new_hits = store->search("trees", {}, 3);
                     require(new_hits.ok() && new_hits.value().size() == 1, "new content indexed");
                     require(!store->add_document(document("", "x")).ok(), "empty id rejected");
                   }});

  tests.push_back({"file_store_persists_across_reopen", [] {
                     tt::TempWorkspace workspace;
                     const auto path = workspace.path() / "db" / "tutor.db";
                     {
                       auto opened = st::SqliteTutorStore::open(path);
                       require(opened.ok(), opened.error());
                       require(opened.value()->update_profile("advanced", "ml").ok(), "update");
                     }
                     auto reopened = st::SqliteTutorStore::open(path);
                     require(reopened.ok(), reopened.error());
                     auto profile = reopened.value()->profile();
                     require(profile.ok(), profile.error());
                     require(profile.value().proficiency == "advanced", "proficiency persisted");
                     require(profile.value().topics_covered.size() == 1, "topic persisted");
                   }});

  tests.push_back({"store_serializes_concurrent_writers", [] {
                     auto store = open_memory_store();
                     std::vector<std::thread> workers;
                     for (int t = 0; t < 4; ++t) {
                       workers.emplace_back([&store, t] {
                         for (int i = 0; i < 25; ++i) {
                           (void)store->log_interaction("event_" + std::to_string(t), "{}");
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     auto recent = store->recent_interactions(1000);
                     require(recent.ok(), recent.error());
                     require(recent.value().size() == 100, "every insert recorded");
                   }});
}
