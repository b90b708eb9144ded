#include "tests/helpers/test_helpers.hpp"

#include "tutorplane/common/fs.hpp"
#include "tutorplane/observability/global.hpp"
#include "tutorplane/observability/noop_observer.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <unistd.h>

namespace tutorplane::testing {

namespace {

class RecordingObserver final : public observability::IObserver {
public:
  explicit RecordingObserver(std::shared_ptr<RecordedTelemetry> telemetry)
      : telemetry_(std::move(telemetry)) {}

  void record_event(const observability::ObserverEvent &event) override {
    std::lock_guard<std::mutex> lock(telemetry_->mutex);
    telemetry_->events.push_back(event);
  }

  void record_metric(const observability::ObserverMetric &metric) override {
    std::lock_guard<std::mutex> lock(telemetry_->mutex);
    telemetry_->metrics.push_back(metric);
  }

  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<RecordedTelemetry> telemetry_;
};

} // namespace

config::Config mock_config() {
  config::Config config;
  config.observability.backend = "none";
  config.storage.database_path = ":memory:";
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("tutorplane-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempWorkspace::create_file(const std::string &name,
                                                 const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
  return file_path;
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = mock_config();
  std::error_code ec;
  std::filesystem::create_directories(workspace.path() / "uploads", ec);
  std::filesystem::create_directories(workspace.path() / "scratch", ec);
  config.safety.writable_roots = {(workspace.path() / "uploads").string()};
  config.safety.shell_working_dir = workspace.path().string();
  config.sandbox.scratch_dir = (workspace.path() / "scratch").string();
  return config;
}

void FakeProcessRunner::push_result(sandbox::ProcessResult result) {
  std::lock_guard<std::mutex> lock(mutex_);
  script_.push_back(Outcome{.failed = false, .message = {}, .result = std::move(result)});
}

void FakeProcessRunner::push_failure(std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  script_.push_back(Outcome{.failed = true, .message = std::move(message), .result = {}});
}

common::Result<sandbox::ProcessResult>
FakeProcessRunner::run(const std::vector<std::string> &argv, const sandbox::ProcessOptions &options) {
  Call call{.argv = argv, .options = options, .paths_existed = {}};
  for (const auto &arg : argv) {
    if (!arg.empty() && arg.front() == '/') {
      std::error_code ec;
      call.paths_existed[arg] = std::filesystem::exists(arg, ec);
    }
  }
  for (const auto &[key, value] : options.environment) {
    if (!value.empty() && value.front() == '/') {
      std::error_code ec;
      call.paths_existed[value] = std::filesystem::exists(value, ec);
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  calls_.push_back(std::move(call));
  if (script_.empty()) {
    return common::Result<sandbox::ProcessResult>::success(sandbox::ProcessResult{});
  }
  Outcome next = std::move(script_.front());
  script_.pop_front();
  if (next.failed) {
    return common::Result<sandbox::ProcessResult>::failure(next.message);
  }
  return common::Result<sandbox::ProcessResult>::success(std::move(next.result));
}

std::vector<FakeProcessRunner::Call> FakeProcessRunner::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

void FakeHttpClient::respond(tools::HttpResponse response) {
  response_ = std::move(response);
  failure_.clear();
}

void FakeHttpClient::fail(std::string message) { failure_ = std::move(message); }

common::Result<tools::HttpResponse> FakeHttpClient::get(const std::string &url,
                                                        const tools::HttpRequestOptions &opts) {
  urls.push_back(url);
  options.push_back(opts);
  if (!failure_.empty()) {
    return common::Result<tools::HttpResponse>::failure(failure_);
  }
  tools::HttpResponse response = response_;
  if (opts.max_body_bytes > 0 && response.body.size() > opts.max_body_bytes) {
    response.body.resize(opts.max_body_bytes);
    response.truncated = true;
  }
  return common::Result<tools::HttpResponse>::success(std::move(response));
}

ObserverCapture::ObserverCapture() : telemetry_(std::make_shared<RecordedTelemetry>()) {
  observability::set_global_observer(std::make_unique<RecordingObserver>(telemetry_));
}

ObserverCapture::~ObserverCapture() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

bool program_available(const std::string &program) {
  const char *path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return false;
  }
  std::stringstream stream(path_env);
  std::string dir;
  while (std::getline(stream, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    const auto candidate = std::filesystem::path(dir) / program;
    if (access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

} // namespace tutorplane::testing
