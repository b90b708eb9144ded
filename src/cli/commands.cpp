#include "tutorplane/cli/commands.hpp"

#include "tutorplane/common/fs.hpp"
#include "tutorplane/config/config.hpp"
#include "tutorplane/runtime/app.hpp"
#include "tutorplane/sandbox/language.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace tutorplane::cli {

namespace {

std::string version_string() {
#ifdef TUTORPLANE_VERSION
  std::string version = TUTORPLANE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "tutorplane " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || args[i] == short_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

std::string rejected_line(const common::Error &error) {
  control::ExecutionEnvelope envelope;
  envelope.error = error;
  return envelope.to_json();
}

common::Result<std::unique_ptr<runtime::App>> open_app() {
  auto app = runtime::App::from_disk();
  if (app.ok()) {
    for (const auto &warning : app.value()->warnings()) {
      std::cerr << "warning: " << warning << "\n";
    }
  }
  return app;
}

// exec <action> [key=value ...] [--session ID] | exec --json '<plan>'
int run_exec(std::vector<std::string> args) {
  std::string plan_json;
  const bool has_json = take_option(args, "--json", "-j", plan_json);
  std::string session;
  (void)take_option(args, "--session", "-s", session);

  control::ActionPlan plan;
  if (has_json) {
    auto parsed = control::ActionPlan::from_json(plan_json == "-" ? read_stdin_all() : plan_json);
    if (!parsed.ok()) {
      std::cerr << "invalid plan: " << parsed.error() << "\n";
      return 1;
    }
    plan = std::move(parsed.value());
  } else {
    if (args.empty()) {
      std::cerr << "usage: tutorplane exec <action> [key=value ...] [--session ID]\n";
      return 1;
    }
    plan.action = args[0];
    for (std::size_t i = 1; i < args.size(); ++i) {
      const auto eq = args[i].find('=');
      if (eq == std::string::npos) {
        std::cerr << "expected key=value, got: " << args[i] << "\n";
        return 1;
      }
      plan.parameters[args[i].substr(0, eq)] = args[i].substr(eq + 1);
    }
  }
  if (!session.empty()) {
    plan.context["session_id"] = session;
  }

  auto app = open_app();
  if (!app.ok()) {
    std::cerr << app.error() << "\n";
    return 1;
  }
  const auto envelope = app.value()->control_plane().execute(plan);
  std::cout << envelope.to_json() << "\n";
  return envelope.success ? 0 : 1;
}

int run_serve() {
  auto app = open_app();
  if (!app.ok()) {
    std::cerr << app.error() << "\n";
    return 1;
  }
  (void)serve_stream(app.value()->control_plane(), std::cin, std::cout);
  return 0;
}

// run <language> [FILE]; the source is read from stdin without FILE.
int run_code(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: tutorplane run <language> [FILE]\n";
    return 1;
  }

  std::string source;
  if (args.size() > 1) {
    auto text = common::read_text_file(args[1]);
    if (!text.ok()) {
      std::cerr << text.error() << "\n";
      return 1;
    }
    source = std::move(text.value());
  } else {
    source = read_stdin_all();
  }

  auto app = open_app();
  if (!app.ok()) {
    std::cerr << app.error() << "\n";
    return 1;
  }

  control::ActionPlan plan;
  plan.action = "run_code";
  plan.parameters = {{"code", source}, {"language", args[0]}};
  const auto envelope = app.value()->control_plane().execute(plan);
  if (!envelope.success || !envelope.result.has_value()) {
    std::cerr << (envelope.error.has_value() ? envelope.error->message : "execution failed") << "\n";
    return 1;
  }

  const tools::ToolResult &result = *envelope.result;
  if (result.sandbox.has_value()) {
    std::cout << result.sandbox->stdout_text;
    std::cerr << result.sandbox->stderr_text;
  }
  if (!result.ok()) {
    std::cerr << result.status << ": " << result.error->message << "\n";
    return 1;
  }
  return result.sandbox.has_value() ? result.sandbox->exit_code : 0;
}

int run_languages() {
  for (const auto &profile : sandbox::language_profiles()) {
    std::vector<std::string> aliases(profile.aliases.begin(), profile.aliases.end());
    std::cout << profile.name << (profile.compiled() ? "  (compiled)" : "  (interpreted)");
    if (!aliases.empty()) {
      std::cout << "  aliases: " << common::join(aliases, ", ");
    }
    std::cout << "\n";
  }
  return 0;
}

int run_actions() {
  auto app = open_app();
  if (!app.ok()) {
    std::cerr << app.error() << "\n";
    return 1;
  }
  for (const auto &spec : app.value()->router().all_specs()) {
    std::cout << spec.name << "  [" << spec.group << (spec.safe ? "" : ", mutating") << "]  "
              << spec.description << "\n";
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (args[0] == "validate") {
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "invalid configuration: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "configuration ok\n";
    return 0;
  }

  std::cerr << "unknown config command: " << args[0] << "\n";
  return 1;
}

} // namespace

std::string handle_plan_line(control::ControlPlane &plane, const std::string &line) {
  auto plan = control::ActionPlan::from_json(line);
  if (!plan.ok()) {
    return rejected_line(common::Error{.kind = common::ErrorKind::InvalidArguments,
                                       .message = "invalid plan: " + plan.error()});
  }
  return plane.execute(plan.value()).to_json();
}

std::size_t serve_stream(control::ControlPlane &plane, std::istream &in, std::ostream &out) {
  std::size_t handled = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    out << handle_plan_line(plane, line) << "\n";
    out.flush();
    ++handled;
  }
  return handled;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: tutorplane [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  exec <action> [key=value ...]  Execute one action through the control plane\n";
  std::cout << "  exec --json PLAN               Execute a JSON action plan (- reads stdin)\n";
  std::cout << "  serve                          Read JSON plans from stdin, one per line\n";
  std::cout << "  run <language> [FILE]          Run a program in the sandbox\n";
  std::cout << "  languages                      List supported languages\n";
  std::cout << "  actions                        List routed actions\n";
  std::cout << "  config [show|path|validate]    Inspect the configuration\n";
  std::cout << "  version                        Show version\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "exec") {
    return run_exec(std::move(args));
  }
  if (subcommand == "serve") {
    return run_serve();
  }
  if (subcommand == "run") {
    return run_code(std::move(args));
  }
  if (subcommand == "languages") {
    return run_languages();
  }
  if (subcommand == "actions") {
    return run_actions();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace tutorplane::cli
