#pragma once

#include "tutorplane/config/schema.hpp"
#include "tutorplane/sandbox/language.hpp"
#include "tutorplane/sandbox/process.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace tutorplane::sandbox {

enum class SandboxStatus { Success, CompilationError, Timeout, InternalError };

/// The step a job reached before it finished.
enum class SandboxPhase { Validate, Materialize, Compile, Execute };

[[nodiscard]] std::string_view sandbox_status_name(SandboxStatus status);
[[nodiscard]] std::string_view sandbox_phase_name(SandboxPhase phase);

/// A program that ran and exited non-zero, or wrote to stderr, is still
/// Success: the sandbox did its job.
struct SandboxResult {
  SandboxStatus status = SandboxStatus::InternalError;
  SandboxPhase phase = SandboxPhase::Validate;
  std::string language;
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  std::chrono::milliseconds duration{0};
  /// Set for Timeout and InternalError.
  std::string error;

  [[nodiscard]] std::string to_json() const;
};

struct SandboxLimits {
  std::chrono::seconds exec_timeout{10};
  std::chrono::seconds compile_timeout{30};
  /// Parent of the per-job directories; empty means the system temp dir.
  std::filesystem::path scratch_dir;
  std::size_t max_output_bytes = 64 * 1024;
  std::size_t max_diagnostic_bytes = 8 * 1024;
  std::uint64_t max_memory_mb = 0;

  [[nodiscard]] static SandboxLimits from_config(const config::Config &config);
};

/// Holds no per-run state; concurrent run() calls each get their own
/// directory under the scratch dir.
class SandboxExecutor {
public:
  explicit SandboxExecutor(SandboxLimits limits, std::shared_ptr<IProcessRunner> runner =
                                                     std::make_shared<PosixProcessRunner>());

  [[nodiscard]] SandboxResult run(std::string_view language, const std::string &source) const;

  [[nodiscard]] const SandboxLimits &limits() const { return limits_; }

private:
  void run_job(const LanguageProfile &profile, const std::string &source,
               SandboxResult &result) const;
  [[nodiscard]] std::filesystem::path scratch_root() const;

  SandboxLimits limits_;
  std::shared_ptr<IProcessRunner> runner_;
};

} // namespace tutorplane::sandbox
