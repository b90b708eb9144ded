#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tutorplane/common/fs.hpp"
#include "tutorplane/security/policy.hpp"

#include <filesystem>
#include <string>

namespace {

tutorplane::security::SafetyPolicy
policy_for(const tutorplane::testing::TempWorkspace &workspace) {
  tutorplane::security::SafetyPolicy policy;
  policy.writable_roots = {workspace.path() / "uploads"};
  std::filesystem::create_directories(workspace.path() / "uploads");
  return policy;
}

} // namespace

void register_security_tests(std::vector<tutorplane::tests::TestCase> &tests) {
  using tutorplane::tests::require;
  namespace sec = tutorplane::security;
  namespace common = tutorplane::common;
  namespace tt = tutorplane::testing;

  tests.push_back({"normalize_action_identifier_strips_argument_group", [] {
                     require(sec::normalize_action_identifier("run_code") == "run_code", "plain");
                     require(sec::normalize_action_identifier("  Run_Code  ") == "run_code",
                             "trimmed and lower-cased");
                     require(sec::normalize_action_identifier("run_code(python)") == "run_code",
                             "argument group dropped");
                     require(sec::normalize_action_identifier("read_file (a, (b))") == "read_file",
                             "nested group accepted");
                   }});

  tests.push_back({"normalize_action_identifier_rejects_malformed_names", [] {
                     require(!sec::normalize_action_identifier("").has_value(), "empty");
                     require(!sec::normalize_action_identifier("9lives").has_value(), "digit start");
                     require(!sec::normalize_action_identifier("run code").has_value(), "space");
                     require(!sec::normalize_action_identifier("run_code(").has_value(), "unbalanced");
                     require(!sec::normalize_action_identifier("run_code()x").has_value(),
                             "trailing text");
                     require(!sec::normalize_action_identifier("../read_file").has_value(), "path");
                   }});

  tests.push_back({"validate_plan_accepts_allowed_actions", [] {
                     const sec::SafetyPolicy policy;
                     auto validated = policy.validate_plan("Search_Knowledge", {{"query", "x"}});
                     require(validated.ok(), validated.error());
                     require(validated.value() == "search_knowledge", "normalized name returned");
                   }});

  tests.push_back({"validate_plan_rejects_unlisted_and_malformed_actions", [] {
                     sec::SafetyPolicy policy;
                     policy.allowed_actions = {"read_file"};
                     auto denied = policy.validate_plan("run_code", {});
                     require(!denied.ok(), "unlisted action must fail");
                     require(denied.error_kind() == common::ErrorKind::SafetyViolation,
                             "safety violation expected");
                     require(common::starts_with(denied.error(), "safety validation failed"),
                             denied.error());

                     auto malformed = policy.validate_plan("read_file; rm -rf /", {});
                     require(!malformed.ok(), "malformed action must fail");
                     require(malformed.error_kind() == common::ErrorKind::SafetyViolation,
                             "safety violation expected");
                   }});

  tests.push_back({"validate_plan_enforces_parameter_limit", [] {
                     sec::SafetyPolicy policy;
                     policy.max_parameters = 2;
                     require(policy.validate_plan("read_file", {{"a", "1"}, {"b", "2"}}).ok(),
                             "limit is inclusive");
                     auto denied =
                         policy.validate_plan("read_file", {{"a", "1"}, {"b", "2"}, {"c", "3"}});
                     require(!denied.ok(), "three parameters must fail");
                     require(denied.error().find("exceeds the limit of 2") != std::string::npos,
                             denied.error());
                     require(!policy.validate_plan("read_file", {{" ", "1"}}).ok(),
                             "blank parameter name must fail");
                   }});

  tests.push_back({"from_config_normalizes_actions_and_rejects_garbage", [] {
                     auto config = tt::mock_config();
                     config.safety.allowed_actions = {"Run_Code", "read_file"};
                     config.sandbox.exec_timeout_seconds = 4;
                     auto policy = sec::SafetyPolicy::from_config(config);
                     require(policy.ok(), policy.error());
                     require(policy.value().is_action_allowed("run_code"), "normalized entry");
                     require(!policy.value().is_action_allowed("write_file"), "not listed");
                     require(policy.value().exec_timeout == std::chrono::seconds(4), "timeout");

                     config.safety.allowed_actions = {"run code"};
                     require(!sec::SafetyPolicy::from_config(config).ok(), "invalid entry must fail");
                   }});

  tests.push_back({"is_command_allowed_matches_bare_names_only", [] {
                     const sec::SafetyPolicy policy;
                     require(policy.is_command_allowed("ls"), "ls whitelisted by default");
                     require(policy.is_command_allowed("grep"), "grep whitelisted by default");
                     require(!policy.is_command_allowed("rm"), "rm not whitelisted");
                     require(!policy.is_command_allowed("/bin/ls"), "absolute path refused");
                     require(!policy.is_command_allowed("ls -la"), "embedded argument refused");
                     require(!policy.is_command_allowed(""), "empty refused");
                   }});

  tests.push_back({"check_writable_accepts_paths_inside_roots", [] {
                     tt::TempWorkspace workspace;
                     const auto policy = policy_for(workspace);
                     const auto target = workspace.path() / "uploads" / "notes" / "a.txt";
                     auto checked = policy.check_writable(target.string());
                     require(checked.ok(), checked.error());
                     require(checked.value().filename() == "a.txt", "canonical path returned");
                   }});

  tests.push_back({"check_writable_rejects_traversal_and_prefix_tricks", [] {
                     tt::TempWorkspace workspace;
                     const auto policy = policy_for(workspace);
                     const auto escape = workspace.path() / "uploads" / ".." / "secret.txt";
                     auto traversal = policy.check_writable(escape.string());
                     require(!traversal.ok(), "dot-dot escape must fail");
                     require(traversal.error_kind() == common::ErrorKind::PermissionDenied,
                             "permission denied expected");

                     const auto sibling = workspace.path() / "uploads-evil" / "x.txt";
                     require(!policy.check_writable(sibling.string()).ok(),
                             "string-prefix sibling must fail");
                     require(!policy.check_writable("/etc/passwd").ok(), "system path must fail");
                   }});

  tests.push_back({"check_writable_follows_symlinks_out_of_roots", [] {
                     tt::TempWorkspace workspace;
                     const auto policy = policy_for(workspace);
                     std::filesystem::create_directories(workspace.path() / "outside");
                     std::filesystem::create_directory_symlink(workspace.path() / "outside",
                                                               workspace.path() / "uploads" / "link");
                     const auto through_link = workspace.path() / "uploads" / "link" / "f.txt";
                     auto checked = policy.check_writable(through_link.string());
                     require(!checked.ok(), "symlink escape must fail");
                     require(checked.error_kind() == common::ErrorKind::PermissionDenied,
                             "permission denied expected");
                   }});

  tests.push_back({"check_writable_rejects_empty_and_nul_paths", [] {
                     tt::TempWorkspace workspace;
                     const auto policy = policy_for(workspace);
                     auto empty = policy.check_writable("");
                     require(!empty.ok(), "empty path must fail");
                     require(empty.error_kind() == common::ErrorKind::InvalidArguments,
                             "invalid arguments expected");

                     std::string with_nul = (workspace.path() / "uploads" / "a").string();
                     with_nul.push_back('\0');
                     with_nul += "b";
                     auto nul = policy.check_writable(with_nul);
                     require(!nul.ok(), "NUL byte must fail");
                     require(nul.error_kind() == common::ErrorKind::PermissionDenied,
                             "permission denied expected");
                   }});
}
