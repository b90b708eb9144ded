#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tutorplane::config {

struct SafetyConfig {
  std::vector<std::string> allowed_actions = {
      "search_knowledge", "assess_understanding", "update_learner_profile",
      "log_interaction",  "read_file",            "list_directory",
      "ingest_document",  "analyze_image",        "write_file",
      "delete_file",      "web_search",           "fetch_url",
      "execute_command",  "run_code",             "set_assignment"};
  std::uint32_t max_parameters = 10;
  std::vector<std::string> writable_roots = {"/app/uploads", "/tmp"};
  std::vector<std::string> shell_whitelist = {"ls",   "pwd",  "cat",  "grep",
                                              "find", "wc",   "head", "tail"};
  std::string shell_working_dir;
  std::uint32_t command_timeout_seconds = 10;
  std::uint64_t command_output_chars = 1000;
};

struct SandboxConfig {
  std::string scratch_dir;
  std::uint32_t exec_timeout_seconds = 10;
  std::uint32_t compile_timeout_seconds = 30;
  std::uint64_t max_output_bytes = 64 * 1024;
  std::uint64_t max_diagnostic_bytes = 8 * 1024;
  std::uint64_t max_memory_mb = 0;
};

struct StorageConfig {
  std::string database_path = "~/.tutorplane/tutorplane.db";
  std::uint32_t search_top_k = 3;
};

struct AuditConfig {
  std::string journal_path;
};

struct WebConfig {
  std::string user_agent = "Mozilla/5.0 (compatible; tutorplane/0.1)";
  std::uint32_t timeout_seconds = 10;
  std::uint64_t max_content_bytes = 50'000;
  std::uint32_t max_search_results = 5;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SafetyConfig safety;
  SandboxConfig sandbox;
  StorageConfig storage;
  AuditConfig audit;
  WebConfig web;
  ObservabilityConfig observability;

  // Keys present in the file that no section above reads.
  std::vector<std::string> unknown_keys;
};

} // namespace tutorplane::config
