#pragma once

#include "tutorplane/config/schema.hpp"
#include "tutorplane/observability/observer.hpp"
#include "tutorplane/sandbox/process.hpp"
#include "tutorplane/tools/http.hpp"

#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tutorplane::testing {

config::Config mock_config();

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// mock_config() with writable root <workspace>/uploads, scratch dir
/// <workspace>/scratch and an in-memory database.
config::Config temp_config(const TempWorkspace &workspace);

/// Scripted process runner. Each call pops the next scripted outcome, or
/// returns a clean exit when the script is empty.
class FakeProcessRunner final : public sandbox::IProcessRunner {
public:
  struct Call {
    std::vector<std::string> argv;
    sandbox::ProcessOptions options;
    /// Whether each absolute-path argument or environment value existed when
    /// the call was made.
    std::map<std::string, bool> paths_existed;
  };

  void push_result(sandbox::ProcessResult result);
  void push_failure(std::string message);

  [[nodiscard]] common::Result<sandbox::ProcessResult>
  run(const std::vector<std::string> &argv, const sandbox::ProcessOptions &options) override;

  [[nodiscard]] std::vector<Call> calls() const;

private:
  struct Outcome {
    bool failed = false;
    std::string message;
    sandbox::ProcessResult result;
  };

  mutable std::mutex mutex_;
  std::deque<Outcome> script_;
  std::vector<Call> calls_;
};

class FakeHttpClient final : public tools::IHttpClient {
public:
  void respond(tools::HttpResponse response);
  void fail(std::string message);

  [[nodiscard]] common::Result<tools::HttpResponse>
  get(const std::string &url, const tools::HttpRequestOptions &options) override;

  std::vector<std::string> urls;
  std::vector<tools::HttpRequestOptions> options;

private:
  tools::HttpResponse response_;
  std::string failure_;
};

struct RecordedTelemetry {
  std::mutex mutex;
  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;

  template <typename Event> std::size_t count_events() {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t count = 0;
    for (const auto &event : events) {
      if (std::holds_alternative<Event>(event)) {
        ++count;
      }
    }
    return count;
  }

  template <typename Event> std::vector<Event> events_of() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Event> out;
    for (const auto &event : events) {
      if (const auto *typed = std::get_if<Event>(&event)) {
        out.push_back(*typed);
      }
    }
    return out;
  }
};

/// Installs a recording observer for the lifetime of the object and restores
/// a no-op observer afterwards.
class ObserverCapture {
public:
  ObserverCapture();
  ~ObserverCapture();

  ObserverCapture(const ObserverCapture &) = delete;
  ObserverCapture &operator=(const ObserverCapture &) = delete;

  [[nodiscard]] RecordedTelemetry &telemetry() { return *telemetry_; }

private:
  std::shared_ptr<RecordedTelemetry> telemetry_;
};

/// True when `program` resolves on PATH.
[[nodiscard]] bool program_available(const std::string &program);

} // namespace tutorplane::testing
