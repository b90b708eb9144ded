#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tutorplane/cli/commands.hpp"
#include "tutorplane/common/json_util.hpp"
#include "tutorplane/control/action_plan.hpp"
#include "tutorplane/control/action_router.hpp"
#include "tutorplane/control/audit_log.hpp"
#include "tutorplane/control/control_plane.hpp"
#include "tutorplane/runtime/app.hpp"

#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

namespace control = tutorplane::control;
namespace tools = tutorplane::tools;
namespace tt = tutorplane::testing;

class ExplodingTool final : public tools::ITool {
public:
  [[nodiscard]] tools::Action action() const override { return tools::Action::SetAssignment; }
  [[nodiscard]] std::string_view description() const override { return "always throws"; }
  [[nodiscard]] std::string parameters_schema() const override { return "{}"; }
  tutorplane::common::Result<tools::ToolResult> execute(const tools::ToolArgs &,
                                                        const tools::ToolContext &) override {
    throw std::runtime_error("boom");
  }
  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "test"; }
};

struct PlaneFixture {
  std::shared_ptr<tt::FakeProcessRunner> runner = std::make_shared<tt::FakeProcessRunner>();
  std::shared_ptr<tutorplane::security::SafetyPolicy> policy =
      std::make_shared<tutorplane::security::SafetyPolicy>();
  std::shared_ptr<control::AuditLog> audit = std::make_shared<control::AuditLog>();
  std::unique_ptr<control::ControlPlane> plane;

  explicit PlaneFixture(const tt::TempWorkspace &workspace) {
    policy->writable_roots = {workspace.path() / "uploads"};
    policy->shell_working_dir = workspace.path();
    std::filesystem::create_directories(workspace.path() / "uploads");

    tutorplane::sandbox::SandboxLimits limits;
    limits.scratch_dir = workspace.path();
    control::RouterDependencies deps;
    deps.policy = policy;
    deps.executor = std::make_shared<const tutorplane::sandbox::SandboxExecutor>(limits, runner);
    deps.runner = runner;
    auto router = std::make_shared<control::ActionRouter>(control::ActionRouter::create_default(deps));
    plane = std::make_unique<control::ControlPlane>(policy, router, audit);
  }
};

control::ActionPlan plan(std::string action, std::map<std::string, std::string> parameters = {},
                         std::map<std::string, std::string> context = {}) {
  return control::ActionPlan{.action = std::move(action),
                             .parameters = std::move(parameters),
                             .context = std::move(context)};
}

} // namespace

void register_control_tests(std::vector<tutorplane::tests::TestCase> &tests) {
  using tutorplane::tests::require;
  namespace common = tutorplane::common;
  namespace obs = tutorplane::observability;

  tests.push_back({"action_plan_parses_json", [] {
                     auto parsed = control::ActionPlan::from_json(
                         R"json({"action":"run_code","parameters":{"code":"print(1)","limit":3},"context":{"session_id":"s"}})json");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().action == "run_code", "action");
                     require(parsed.value().parameters.at("code") == "print(1)", "string parameter");
                     require(parsed.value().parameters.at("limit") == "3", "scalar kept as text");
                     require(parsed.value().context.at("session_id") == "s", "context");

                     auto bad = control::ActionPlan::from_json(R"({"action":"x","parameters":[1]})");
                     require(!bad.ok(), "array parameters must fail");
                     require(bad.error_kind() == common::ErrorKind::InvalidArguments, "kind");
                     require(!control::ActionPlan::from_json("not json").ok(), "garbage must fail");
                   }});

  tests.push_back({"router_reports_unknown_and_unregistered_actions", [] {
                     control::ActionRouter router;
                     auto unknown = router.route("teleport", {}, {});
                     require(!unknown.ok(), "unknown action must fail");
                     require(unknown.error->kind == common::ErrorKind::UnknownAction, "kind");
                     require(unknown.error->message == "unknown action: teleport",
                             unknown.error->message);

                     auto unregistered = router.route("read_file", {}, {});
                     require(!unregistered.ok() &&
                                 unregistered.error->kind == common::ErrorKind::UnknownAction,
                             "known but unregistered action");
                   }});

  tests.push_back({"router_turns_exceptions_into_errors", [] {
                     control::ActionRouter router;
                     router.register_tool(std::make_unique<ExplodingTool>());
                     auto result = router.route("set_assignment", {}, {});
                     require(!result.ok(), "exception becomes an error");
                     require(result.status == "error", result.status);
                     require(result.error->kind == common::ErrorKind::InternalError, "kind");
                     require(result.error->message == "set_assignment failed: boom",
                             result.error->message);
                   }});

  tests.push_back({"default_router_registers_every_action", [] {
                     const auto router = control::ActionRouter::create_default({});
                     for (const auto action : tools::all_actions()) {
                       require(router.get_tool(action) != nullptr, std::string(tools::action_name(action)));
                     }
                     require(router.all_specs().size() == tools::kActionCount, "one spec per action");
                     auto unavailable = router.route("search_knowledge", {{"query", "x"}}, {});
                     require(!unavailable.ok(), "store-backed tool without a store");
                   }});

  tests.push_back({"control_plane_rejects_unsafe_plans_without_auditing", [] {
                     tt::ObserverCapture capture;
                     tt::TempWorkspace workspace;
                     PlaneFixture fixture(workspace);
                     fixture.policy->allowed_actions.erase("execute_command");

                     auto denied = fixture.plane->execute(plan("execute_command", {{"command", "ls"}}));
                     require(!denied.success, "rejected");
                     require(denied.error.has_value() &&
                                 denied.error->kind == common::ErrorKind::SafetyViolation,
                             "safety violation");
                     require(!denied.metadata.safety_checks_passed, "checks failed");
                     require(fixture.audit->size() == 0, "rejections are not audited");
                     require(fixture.plane->rejected_count() == 1, "rejection counted");
                     require(fixture.runner->calls().empty(), "nothing executed");
                     require(capture.telemetry().count_events<obs::SafetyViolationEvent>() == 1,
                             "violation observed");

                     auto malformed = fixture.plane->execute(plan("read_file(x"));
                     require(!malformed.success, "malformed action rejected");

                     std::map<std::string, std::string> crowded;
                     for (int i = 0; i < 11; ++i) {
                       crowded["p" + std::to_string(i)] = "v";
                     }
                     auto too_many = fixture.plane->execute(plan("read_file", crowded));
                     require(!too_many.success, "too many parameters rejected");
                     require(fixture.plane->rejected_count() == 3, "three rejections");
                     require(fixture.plane->execution_count() == 0, "no executions");
                   }});

  tests.push_back({"control_plane_routes_and_counts_executions", [] {
                     tt::ObserverCapture capture;
                     tt::TempWorkspace workspace;
                     PlaneFixture fixture(workspace);

                     auto first = fixture.plane->execute(plan("Assess_Understanding", {{"topic", "math"}}));
                     require(first.success, "first execution");
                     require(first.action == "assess_understanding", "normalized action");
                     require(first.metadata.execution_count == 1, "count 1");
                     require(first.metadata.safety_checks_passed, "checks passed");
                     require(first.result.has_value() && first.result->ok(), "tool succeeded");

                     auto second = fixture.plane->execute(plan("read_file", {{"path", "/no/such/file"}}));
                     require(second.success, "tool errors are still executions");
                     require(!second.result->ok(), "tool reported an error");
                     require(second.result->error->kind == common::ErrorKind::NotFound, "not found");
                     require(second.metadata.execution_count == 2, "count 2");

                     require(fixture.audit->size() == 2, "both audited");
                     require(fixture.audit->entries()[1].action == "read_file", "audited action");
                     const auto executed = capture.telemetry().events_of<obs::ActionExecutedEvent>();
                     require(executed.size() == 2, "two execution events");
                     require(!executed[1].tool_succeeded, "tool failure observed");
                   }});

  tests.push_back({"control_plane_passes_session_context", [] {
                     tt::TempWorkspace workspace;
                     PlaneFixture fixture(workspace);
                     auto store_less = fixture.plane->execute(
                         plan("search_knowledge", {{"query", "x"}}, {{"session_id", "s-9"}}));
                     require(store_less.success, "routed");
                     require(fixture.audit->entries()[0].plan.context.at("session_id") == "s-9",
                             "context recorded in the audit entry");
                   }});

  tests.push_back({"control_plane_runs_code_through_the_sandbox", [] {
                     tt::TempWorkspace workspace;
                     PlaneFixture fixture(workspace);
                     tutorplane::sandbox::ProcessResult printed;
                     printed.stdout_text = "hi\n";
                     fixture.runner->push_result(printed);
                     auto ran = fixture.plane->execute(
                         plan("run_code", {{"code", "print('hi')"}, {"language", "python"}}));
                     require(ran.success, "executed");
                     require(ran.result->string_field("stdout") == "hi\n", "sandbox stdout");
                     require(fixture.runner->calls().size() == 1, "one process");
                   }});

  tests.push_back({"execution_envelope_json_shapes", [] {
                     tt::TempWorkspace workspace;
                     PlaneFixture fixture(workspace);
                     auto ok = fixture.plane->execute(plan("set_assignment", {{"description", "Sort"}}));
                     auto parsed = common::json_parse_flat(ok.to_json());
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().at("success") == "true", "success flag");
                     require(parsed.value().at("action") == "set_assignment", "action");
                     require(parsed.value().count("error") == 0, "no error member");
                     require(parsed.value().at("metadata") ==
                                 R"({"execution_count":1,"safety_checks_passed":true})",
                             parsed.value().at("metadata"));

                     auto denied = fixture.plane->execute(plan("format_disk"));
                     auto rejected = common::json_parse_flat(denied.to_json());
                     require(rejected.ok(), rejected.error());
                     require(rejected.value().at("success") == "false", "failure flag");
                     require(rejected.value().at("error").find("\"kind\":\"safety_violation\"") !=
                                 std::string::npos,
                             rejected.value().at("error"));
                     require(rejected.value().at("result") == rejected.value().at("error"),
                             "result carries the error object");
                   }});

  tests.push_back({"control_plane_is_safe_under_concurrency", [] {
                     tt::TempWorkspace workspace;
                     PlaneFixture fixture(workspace);
                     std::vector<std::thread> workers;
                     for (int t = 0; t < 8; ++t) {
                       workers.emplace_back([&fixture] {
                         for (int i = 0; i < 25; ++i) {
                           (void)fixture.plane->execute(plan("assess_understanding", {{"topic", "ml"}}));
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(fixture.plane->execution_count() == 200, "every execution counted");
                     const auto status = fixture.audit->verify();
                     require(status.ok(), status.error());
                     std::set<std::uint64_t> sequences;
                     for (const auto &entry : fixture.audit->entries()) {
                       sequences.insert(entry.sequence);
                     }
                     require(sequences.size() == 200, "sequences are unique");
                   }});

  tests.push_back({"audit_chain_detects_tampering", [] {
                     control::AuditLog audit;
                     require(audit.head_digest() == control::AuditLog::genesis_digest(), "genesis");
                     require(audit.append(plan("a"), "a", "{}") == 1, "first entry");
                     require(audit.append(plan("b"), "b", R"({"x":1})") == 2, "second entry");
                     require(audit.append(plan("c"), "c", "{}") == 3, "third entry");
                     require(audit.verify().ok(), "intact chain verifies");
                     require(audit.head_digest() == audit.entries().back().digest, "head digest");

                     auto edited = audit.entries();
                     edited[1].result_json = R"({"x":2})";
                     auto mismatch = control::AuditLog::verify_chain(edited);
                     require(!mismatch.ok(), "edited body must fail");
                     require(mismatch.error() == "audit entry 2: digest mismatch", mismatch.error());

                     auto dropped = audit.entries();
                     dropped.erase(dropped.begin() + 1);
                     require(!control::AuditLog::verify_chain(dropped).ok(), "dropped entry must fail");

                     auto relinked = audit.entries();
                     relinked[2].previous_digest = relinked[0].digest;
                     relinked[2].sequence = 3;
                     auto broken = control::AuditLog::verify_chain(relinked);
                     require(broken.error() == "audit entry 3: chain link broken", broken.error());
                   }});

  tests.push_back({"audit_journal_writes_one_line_per_entry", [] {
                     tt::TempWorkspace workspace;
                     const auto journal = workspace.path() / "audit" / "journal.jsonl";
                     control::AuditLog audit(journal);
                     (void)audit.append(plan("a"), "a", "{}");
                     (void)audit.append(plan("b"), "b", "{}");

                     std::ifstream in(journal);
                     std::vector<std::string> lines;
                     std::string line;
                     while (std::getline(in, line)) {
                       lines.push_back(line);
                     }
                     require(lines.size() == 2, "two journal lines");
                     auto parsed = common::json_parse_flat(lines[1]);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().at("digest") == audit.entries()[1].digest, "digest");
                     require(parsed.value().at("previous_digest") == audit.entries()[0].digest,
                             "chain link");
                   }});

  tests.push_back({"app_wires_components_from_config", [] {
                     tt::TempWorkspace workspace;
                     auto config = tt::temp_config(workspace);
                     config.audit.journal_path = (workspace.path() / "audit.jsonl").string();
                     tutorplane::runtime::AppOverrides overrides;
                     auto runner = std::make_shared<tt::FakeProcessRunner>();
                     overrides.runner = runner;
                     overrides.http = std::make_shared<tt::FakeHttpClient>();
                     overrides.install_observer = false;

                     auto app = tutorplane::runtime::App::create(config, overrides);
                     require(app.ok(), app.error());
                     require(app.value()->store() != nullptr, "in-memory store opened");
                     require(app.value()->sandbox().limits().scratch_dir == workspace.path() / "scratch",
                             "scratch dir from config");

                     auto &plane = app.value()->control_plane();
                     auto written = plane.execute(plan(
                         "write_file", {{"path", (workspace.path() / "uploads" / "a.txt").string()},
                                        {"content", "hello"}}));
                     require(written.success && written.result->ok(), "write inside uploads");
                     auto ingested = plane.execute(
                         plan("ingest_document", {{"path", (workspace.path() / "uploads" / "a.txt").string()}}));
                     require(ingested.success && ingested.result->ok(), "ingest");
                     auto found = plane.execute(plan("search_knowledge", {{"query", "hello"}}));
                     require(found.result->field("count") != nullptr &&
                                 *found.result->field("count") == "1",
                             "search finds the ingested document");
                     require(std::filesystem::exists(workspace.path() / "audit.jsonl"), "journal");
                   }});

  tests.push_back({"app_rejects_invalid_config", [] {
                     auto config = tt::mock_config();
                     config.safety.allowed_actions.clear();
                     tutorplane::runtime::AppOverrides overrides;
                     overrides.install_observer = false;
                     auto app = tutorplane::runtime::App::create(config, overrides);
                     require(!app.ok(), "empty allow list must fail");
                   }});

  tests.push_back({"handle_plan_line_reports_malformed_input", [] {
                     tt::TempWorkspace workspace;
                     PlaneFixture fixture(workspace);
                     const auto line = tutorplane::cli::handle_plan_line(*fixture.plane, "{oops");
                     auto parsed = common::json_parse_flat(line);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().at("success") == "false", "rejected");
                     require(parsed.value().at("error").find("invalid plan") != std::string::npos,
                             parsed.value().at("error"));
                     require(fixture.audit->size() == 0, "not audited");
                   }});

  tests.push_back({"serve_stream_answers_each_line", [] {
                     tt::TempWorkspace workspace;
                     PlaneFixture fixture(workspace);
                     std::istringstream in(
                         R"({"action":"assess_understanding","parameters":{"topic":"python"}})"
                         "\n\n"
                         R"({"action":"rm_rf","parameters":{}})"
                         "\n");
                     std::ostringstream out;
                     const auto handled = tutorplane::cli::serve_stream(*fixture.plane, in, out);
                     require(handled == 2, "two plans handled");

                     std::istringstream replies(out.str());
                     std::string first;
                     std::string second;
                     std::getline(replies, first);
                     std::getline(replies, second);
                     require(first.find("\"success\":true") != std::string::npos, first);
                     require(second.find("\"success\":false") != std::string::npos, second);
                   }});
}
