#include "tutorplane/sandbox/executor.hpp"

#include "tutorplane/common/json_util.hpp"
#include "tutorplane/observability/global.hpp"
#include "tutorplane/sandbox/scoped_temp_dir.hpp"

#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace tutorplane::sandbox {

namespace {

constexpr const char *JOB_PREFIX = "tutorplane-job-";

void fail_internal(SandboxResult &result, std::string message) {
  result.status = SandboxStatus::InternalError;
  result.error = std::move(message);
}

// Cleanup failures are reported but never replace the job's own outcome.
void release(ScopedTempDir &job) {
  if (const auto removed = job.remove(); !removed.ok()) {
    observability::record_error("sandbox", removed.error());
  }
}

// Toolchains and programs keep their temporary files inside the job, so
// release() removes them too. `go run` builds under GOTMPDIR.
std::vector<std::pair<std::string, std::string>>
job_environment(const std::filesystem::path &temp_dir) {
  return {{"TMPDIR", temp_dir.string()}, {"GOTMPDIR", temp_dir.string()}};
}

std::string seconds_text(const std::chrono::seconds timeout) {
  return std::to_string(timeout.count()) + "s";
}

} // namespace

std::string_view sandbox_status_name(const SandboxStatus status) {
  switch (status) {
  case SandboxStatus::Success:
    return "success";
  case SandboxStatus::CompilationError:
    return "compilation_error";
  case SandboxStatus::Timeout:
    return "timeout";
  case SandboxStatus::InternalError:
    return "error";
  }
  return "error";
}

std::string_view sandbox_phase_name(const SandboxPhase phase) {
  switch (phase) {
  case SandboxPhase::Validate:
    return "validate";
  case SandboxPhase::Materialize:
    return "materialize";
  case SandboxPhase::Compile:
    return "compile";
  case SandboxPhase::Execute:
    return "execute";
  }
  return "validate";
}

std::string SandboxResult::to_json() const {
  common::JsonFields fields = {
      {"status", common::json_quote(std::string(sandbox_status_name(status)))},
      {"phase", common::json_quote(std::string(sandbox_phase_name(phase)))},
      {"language", common::json_quote(language)},
      {"stdout", common::json_quote(stdout_text)},
      {"stderr", common::json_quote(stderr_text)},
      {"exit_code", std::to_string(exit_code)},
      {"stdout_truncated", stdout_truncated ? "true" : "false"},
      {"stderr_truncated", stderr_truncated ? "true" : "false"},
      {"duration_ms", std::to_string(duration.count())},
  };
  if (!error.empty()) {
    fields.emplace_back("error", common::json_quote(error));
  }
  return common::json_object(fields);
}

SandboxLimits SandboxLimits::from_config(const config::Config &config) {
  SandboxLimits limits;
  limits.exec_timeout = std::chrono::seconds(config.sandbox.exec_timeout_seconds);
  limits.compile_timeout = std::chrono::seconds(config.sandbox.compile_timeout_seconds);
  limits.scratch_dir = config.sandbox.scratch_dir;
  limits.max_output_bytes = static_cast<std::size_t>(config.sandbox.max_output_bytes);
  limits.max_diagnostic_bytes = static_cast<std::size_t>(config.sandbox.max_diagnostic_bytes);
  limits.max_memory_mb = config.sandbox.max_memory_mb;
  return limits;
}

SandboxExecutor::SandboxExecutor(SandboxLimits limits, std::shared_ptr<IProcessRunner> runner)
    : limits_(std::move(limits)), runner_(std::move(runner)) {}

std::filesystem::path SandboxExecutor::scratch_root() const {
  if (!limits_.scratch_dir.empty()) {
    return limits_.scratch_dir;
  }
  std::error_code ec;
  auto temp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return "/tmp";
  }
  return temp;
}

SandboxResult SandboxExecutor::run(const std::string_view language,
                                   const std::string &source) const {
  const auto started = std::chrono::steady_clock::now();
  SandboxResult result;
  result.language = std::string(language);

  const LanguageProfile *profile = find_language(language);
  if (profile == nullptr) {
    fail_internal(result, "unsupported language: " + std::string(language) +
                              " (supported: " + supported_language_names() + ")");
  } else if (runner_ == nullptr) {
    fail_internal(result, "no process runner configured");
  } else {
    result.language = std::string(profile->name);
    try {
      run_job(*profile, source, result);
    } catch (const std::exception &ex) {
      fail_internal(result, std::string("sandbox failure: ") + ex.what());
    }
  }

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_sandbox_run(result.language, std::string(sandbox_status_name(result.status)),
                                    std::string(sandbox_phase_name(result.phase)),
                                    result.exit_code, result.duration);
  return result;
}

void SandboxExecutor::run_job(const LanguageProfile &profile, const std::string &source,
                              SandboxResult &result) const {
  result.phase = SandboxPhase::Materialize;
  ScopedTempDir job;
  if (const auto created = job.create(scratch_root(), JOB_PREFIX); !created.ok()) {
    fail_internal(result, created.error());
    return;
  }

  const auto source_path = job.create_file("main", std::string(profile.source_extension));
  if (!source_path.ok()) {
    fail_internal(result, source_path.error());
    release(job);
    return;
  }
  {
    std::ofstream out(source_path.value(), std::ios::binary | std::ios::trunc);
    out << source;
    out.close();
    if (!out) {
      fail_internal(result, "failed to write source file " + source_path.value().string());
      release(job);
      return;
    }
  }

  const std::filesystem::path temp_dir = job.path() / "tmp";
  std::error_code ec;
  std::filesystem::create_directory(temp_dir, ec);
  if (ec) {
    fail_internal(result, "failed to create " + temp_dir.string() + ": " + ec.message());
    release(job);
    return;
  }
  const auto environment = job_environment(temp_dir);

  const std::string source_file = source_path.value().string();
  const std::string binary_file =
      std::filesystem::path(source_path.value()).replace_extension().string();

  if (profile.compiled()) {
    result.phase = SandboxPhase::Compile;
    const ProcessOptions compile_options{.timeout = limits_.compile_timeout,
                                         .max_output_bytes = limits_.max_diagnostic_bytes,
                                         .working_dir = job.path(),
                                         .max_memory_mb = 0,
                                         .environment = environment};
    auto compiled = runner_->run(expand_command(profile.compile_command, source_file, binary_file),
                                 compile_options);
    if (!compiled.ok()) {
      fail_internal(result, compiled.error());
      release(job);
      return;
    }

    auto &diagnostics = compiled.value();
    if (diagnostics.timed_out || diagnostics.exit_code != 0) {
      result.status = diagnostics.timed_out ? SandboxStatus::Timeout
                                            : SandboxStatus::CompilationError;
      result.exit_code = diagnostics.exit_code;
      result.stderr_text = std::move(diagnostics.stderr_text);
      result.stderr_truncated = diagnostics.stderr_truncated;
      if (diagnostics.timed_out) {
        result.error = "compilation timed out after " + seconds_text(limits_.compile_timeout);
      }
      release(job);
      return;
    }
  }

  result.phase = SandboxPhase::Execute;
  const ProcessOptions run_options{.timeout = limits_.exec_timeout,
                                   .max_output_bytes = limits_.max_output_bytes,
                                   .working_dir = job.path(),
                                   .max_memory_mb = limits_.max_memory_mb,
                                   .environment = environment};
  auto executed =
      runner_->run(expand_command(profile.run_command, source_file, binary_file), run_options);
  if (!executed.ok()) {
    fail_internal(result, executed.error());
    release(job);
    return;
  }

  auto &process = executed.value();
  result.exit_code = process.exit_code;
  result.stdout_text = std::move(process.stdout_text);
  result.stderr_text = std::move(process.stderr_text);
  result.stdout_truncated = process.stdout_truncated;
  result.stderr_truncated = process.stderr_truncated;
  if (process.timed_out) {
    result.status = SandboxStatus::Timeout;
    result.error = "execution timed out after " + seconds_text(limits_.exec_timeout);
  } else {
    result.status = SandboxStatus::Success;
  }
  release(job);
}

} // namespace tutorplane::sandbox
