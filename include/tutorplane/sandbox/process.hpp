#pragma once

#include "tutorplane/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace tutorplane::sandbox {

struct ProcessOptions {
  std::chrono::milliseconds timeout{10'000};
  /// Per stream. Output past the cap is read and discarded.
  std::size_t max_output_bytes = 64 * 1024;
  std::filesystem::path working_dir;
  /// RLIMIT_AS for the child; 0 leaves it unlimited.
  std::uint64_t max_memory_mb = 0;
  /// Set in the child on top of the inherited environment.
  std::vector<std::pair<std::string, std::string>> environment;
};

struct ProcessResult {
  int exit_code = 0;
  int term_signal = 0;
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  std::chrono::milliseconds duration{0};
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /// Runs argv[0] from PATH with the given arguments. Never goes through a
  /// shell. A timeout is reported in the result, not as a failure; failures
  /// mean the program could not be started at all.
  [[nodiscard]] virtual common::Result<ProcessResult>
  run(const std::vector<std::string> &argv, const ProcessOptions &options) = 0;
};

/// fork/exec runner. Each run gets a supervisor process registered as a
/// child subreaper; the program leads its own process group below it with
/// stdin at /dev/null. When the program exits or the timeout expires the
/// supervisor kills its group, then kills and reaps every remaining
/// descendant, including ones that left the group with setsid().
class PosixProcessRunner final : public IProcessRunner {
public:
  [[nodiscard]] common::Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                  const ProcessOptions &options) override;
};

} // namespace tutorplane::sandbox
