#include "test_framework.hpp"

#include "tutorplane/common/fs.hpp"
#include "tutorplane/common/json_util.hpp"
#include "tutorplane/common/toml.hpp"
#include "tutorplane/config/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(const std::filesystem::path &path) {
    tutorplane::config::set_config_path_override(path);
  }
  ~ConfigOverrideGuard() { tutorplane::config::clear_config_path_override(); }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("tutorplane-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

bool contains(const std::vector<std::string> &values, const std::string &needle) {
  return std::find(values.begin(), values.end(), needle) != values.end();
}

} // namespace

void register_config_tests(std::vector<tutorplane::tests::TestCase> &tests) {
  using tutorplane::tests::require;
  namespace cfg = tutorplane::config;
  namespace common = tutorplane::common;

  tests.push_back({"config_defaults_match_policy_defaults", [] {
                     const cfg::Config config;
                     require(config.safety.allowed_actions.size() == 15, "fifteen default actions");
                     require(config.safety.max_parameters == 10, "max_parameters default");
                     require(config.safety.writable_roots.size() == 2 &&
                                 config.safety.writable_roots[0] == "/app/uploads" &&
                                 config.safety.writable_roots[1] == "/tmp",
                             "writable roots default");
                     require(config.safety.shell_whitelist.size() == 8, "whitelist default");
                     require(config.sandbox.exec_timeout_seconds == 10, "exec timeout default");
                     require(config.sandbox.compile_timeout_seconds == 30, "compile timeout default");
                     require(config.storage.search_top_k == 3, "top_k default");
                     require(config.web.max_content_bytes == 50'000, "fetch cap default");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("TUTORPLANE_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_db("TUTORPLANE_DB_PATH", std::nullopt);
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().sandbox.exec_timeout_seconds == 10, "defaults expected");
                     require(loaded.value().unknown_keys.empty(), "no unknown keys");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"parse_config_reads_every_section", [] {
                     auto parsed = cfg::parse_config(R"(
[safety]
allowed_actions = ["run_code", "read_file"]
max_parameters = 4
writable_roots = ["/srv/uploads"]
shell_whitelist = ["ls"]
command_timeout_seconds = 3

[sandbox]
scratch_dir = "/var/tmp/jobs"
exec_timeout_seconds = 5
compile_timeout_seconds = 20
max_output_bytes = 1_024

[storage]
database_path = "/data/tutor.db"
search_top_k = 7

[audit]
journal_path = "/data/audit.jsonl"

[web]
timeout_seconds = 4

[observability]
backend = "none"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.safety.allowed_actions.size() == 2, "allowed actions");
                     require(config.safety.max_parameters == 4, "max_parameters");
                     require(config.safety.writable_roots.front() == "/srv/uploads", "roots");
                     require(config.safety.command_timeout_seconds == 3, "command timeout");
                     require(config.sandbox.scratch_dir == "/var/tmp/jobs", "scratch dir");
                     require(config.sandbox.exec_timeout_seconds == 5, "exec timeout");
                     require(config.sandbox.compile_timeout_seconds == 20, "compile timeout");
                     require(config.sandbox.max_output_bytes == 1024, "underscored number");
                     require(config.storage.database_path == "/data/tutor.db", "db path");
                     require(config.storage.search_top_k == 7, "top_k");
                     require(config.audit.journal_path == "/data/audit.jsonl", "journal");
                     require(config.web.timeout_seconds == 4, "web timeout");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"parse_config_collects_unknown_keys_as_warnings", [] {
                     auto parsed = cfg::parse_config("[sandbox]\nexec_timeout = 5\n[extra]\nflag = true\n");
                     require(parsed.ok(), parsed.error());
                     require(contains(parsed.value().unknown_keys, "sandbox.exec_timeout"),
                             "misspelled key should be reported");
                     require(contains(parsed.value().unknown_keys, "extra.flag"),
                             "unknown section key should be reported");
                     auto validated = cfg::validate_config(parsed.value());
                     require(validated.ok(), validated.error());
                     require(contains(validated.value(), "unknown config key: extra.flag"),
                             "warning expected");
                   }});

  tests.push_back({"parse_config_rejects_malformed_toml", [] {
                     auto missing_equals = cfg::parse_config("[safety]\nmax_parameters 4\n");
                     require(!missing_equals.ok(), "line without '=' must fail");
                     require(missing_equals.error_kind() == common::ErrorKind::InvalidArguments,
                             "invalid arguments expected");
                     auto duplicate = cfg::parse_config("[web]\ntimeout_seconds = 1\ntimeout_seconds = 2\n");
                     require(!duplicate.ok(), "duplicate key must fail");
                     require(duplicate.error().find("duplicate") != std::string::npos,
                             duplicate.error());
                   }});

  tests.push_back({"validate_config_rejects_unsafe_settings", [] {
                     cfg::Config relative_root;
                     relative_root.safety.writable_roots = {"uploads"};
                     require(!cfg::validate_config(relative_root).ok(), "relative root must fail");

                     cfg::Config path_command;
                     path_command.safety.shell_whitelist = {"/bin/ls"};
                     require(!cfg::validate_config(path_command).ok(), "path command must fail");

                     cfg::Config zero_timeout;
                     zero_timeout.sandbox.exec_timeout_seconds = 0;
                     require(!cfg::validate_config(zero_timeout).ok(), "zero timeout must fail");

                     cfg::Config no_actions;
                     no_actions.safety.allowed_actions.clear();
                     require(!cfg::validate_config(no_actions).ok(), "empty allow list must fail");

                     cfg::Config bad_backend;
                     bad_backend.observability.backend = "prometheus";
                     require(!cfg::validate_config(bad_backend).ok(), "unknown backend must fail");

                     cfg::Config combined;
                     combined.observability.backend = "log,none";
                     require(cfg::validate_config(combined).ok(), "comma list should be accepted");
                   }});

  tests.push_back({"validate_config_warns_on_inverted_timeouts", [] {
                     cfg::Config config;
                     config.sandbox.exec_timeout_seconds = 60;
                     config.sandbox.compile_timeout_seconds = 30;
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(!validated.value().empty(), "warning expected");
                   }});

  tests.push_back({"load_config_reads_override_path_and_env", [] {
                     const auto home = make_temp_home();
                     const auto path = home / "custom.toml";
                     write_file(path, "[storage]\nsearch_top_k = 9\n[sandbox]\nscratch_dir = \"/nowhere\"\n");
                     const ConfigOverrideGuard guard(path);
                     const EnvGuard scratch("TUTORPLANE_SCRATCH_DIR", (home / "scratch").string());
                     const EnvGuard journal("TUTORPLANE_AUDIT_JOURNAL", (home / "audit.jsonl").string());

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().storage.search_top_k == 9, "file value expected");
                     require(loaded.value().sandbox.scratch_dir == (home / "scratch").string(),
                             "env should override scratch dir");
                     require(loaded.value().audit.journal_path == (home / "audit.jsonl").string(),
                             "env should set journal");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"load_config_reports_path_on_parse_error", [] {
                     const auto home = make_temp_home();
                     const auto path = home / "broken.toml";
                     write_file(path, "[safety\n");
                     const ConfigOverrideGuard guard(path);
                     auto loaded = cfg::load_config();
                     require(!loaded.ok(), "broken file must fail");
                     require(loaded.error().find(path.string()) != std::string::npos,
                             "error should name the file");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"render_config_parses_back", [] {
                     cfg::Config config;
                     config.safety.writable_roots = {"/srv/a \"quoted\""};
                     config.sandbox.max_memory_mb = 256;
                     auto reparsed = cfg::parse_config(cfg::render_config(config));
                     require(reparsed.ok(), reparsed.error());
                     require(reparsed.value().safety.writable_roots.front() == "/srv/a \"quoted\"",
                             "escaped quotes should survive");
                     require(reparsed.value().sandbox.max_memory_mb == 256, "memory limit");
                     require(reparsed.value().unknown_keys.empty(), "renderer emits known keys only");
                   }});

  tests.push_back({"json_parse_flat_keeps_nested_values_raw", [] {
                     auto parsed = common::json_parse_flat(
                         R"json({"action":"run_code","parameters":{"code":"print(1)"},"n":3,"s":"a\"b\nc"})json");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().at("action") == "run_code", "string member");
                     require(parsed.value().at("parameters") == R"json({"code":"print(1)"})json",
                             "object kept raw");
                     require(parsed.value().at("n") == "3", "scalar kept raw");
                     require(parsed.value().at("s") == "a\"b\nc", "escapes decoded");
                     require(!common::json_parse_flat("{\"a\":").ok(), "truncated json must fail");
                     require(!common::json_parse_flat("[1,2]").ok(), "array root must fail");
                   }});

  tests.push_back({"json_escape_encodes_control_characters", [] {
                     const std::string escaped = common::json_escape(std::string("a\x01\tb", 4));
                     require(escaped == "a\\u0001\\tb", escaped);
                     auto array = common::json_parse_string_array(R"(["-l", "a b", "\u00e9"])");
                     require(array.ok(), array.error());
                     require(array.value().size() == 3 && array.value()[1] == "a b", "array parse");
                     require(array.value()[2] == "\xc3\xa9", "unicode escape decoded to UTF-8");
                   }});

  tests.push_back({"json_escape_replaces_invalid_utf8", [] {
                     require(common::json_escape("caf\xc3\xa9") == "caf\xc3\xa9", "valid UTF-8 kept");
                     require(common::json_escape("\xe2\x82\xac" "5") == "\xe2\x82\xac" "5",
                             "three byte sequence kept");
                     require(common::json_escape("ok\xff" "z") == "ok\\ufffdz", "stray byte replaced");
                     require(common::json_escape("cut\xe2\x82") == "cut\\ufffd\\ufffd",
                             "truncated sequence replaced byte by byte");
                     require(common::json_escape("\xed\xa0\x80") == "\\ufffd\\ufffd\\ufffd",
                             "encoded surrogate rejected");

                     auto parsed = common::json_parse_flat("{\"out\":" +
                                                           common::json_quote("a\x80" "b") + "}");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().at("out") == "a\xef\xbf\xbd" "b", "decodes to U+FFFD");
                   }});

  tests.push_back({"utf8_trim_partial_tail_drops_cut_sequences", [] {
                     std::string cut = "ab\xe2\x82";
                     common::utf8_trim_partial_tail(cut);
                     require(cut == "ab", "partial euro sign dropped");

                     std::string whole = "ab\xe2\x82\xac";
                     common::utf8_trim_partial_tail(whole);
                     require(whole == "ab\xe2\x82\xac", "complete sequence kept");

                     std::string lead_only = "x\xf0";
                     common::utf8_trim_partial_tail(lead_only);
                     require(lead_only == "x", "lone lead byte dropped");

                     std::string ascii = "plain";
                     common::utf8_trim_partial_tail(ascii);
                     require(ascii == "plain", "ascii untouched");
                   }});
}
