#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace tutorplane::tools {

/// Every action the control plane can route. Adding an enumerator without a
/// name in action_name() is a compile-time warning.
enum class Action {
  SearchKnowledge,
  AssessUnderstanding,
  UpdateLearnerProfile,
  LogInteraction,
  ReadFile,
  ListDirectory,
  IngestDocument,
  AnalyzeImage,
  WriteFile,
  DeleteFile,
  WebSearch,
  FetchUrl,
  ExecuteCommand,
  RunCode,
  SetAssignment,
};

inline constexpr std::size_t kActionCount = 15;

[[nodiscard]] std::string_view action_name(Action action);
[[nodiscard]] std::optional<Action> action_from_string(std::string_view name);
[[nodiscard]] const std::array<Action, kActionCount> &all_actions();

[[nodiscard]] constexpr std::size_t action_index(const Action action) {
  return static_cast<std::size_t>(action);
}

} // namespace tutorplane::tools
