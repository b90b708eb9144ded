#include "tutorplane/tools/action.hpp"

namespace tutorplane::tools {

std::string_view action_name(const Action action) {
  switch (action) {
  case Action::SearchKnowledge:
    return "search_knowledge";
  case Action::AssessUnderstanding:
    return "assess_understanding";
  case Action::UpdateLearnerProfile:
    return "update_learner_profile";
  case Action::LogInteraction:
    return "log_interaction";
  case Action::ReadFile:
    return "read_file";
  case Action::ListDirectory:
    return "list_directory";
  case Action::IngestDocument:
    return "ingest_document";
  case Action::AnalyzeImage:
    return "analyze_image";
  case Action::WriteFile:
    return "write_file";
  case Action::DeleteFile:
    return "delete_file";
  case Action::WebSearch:
    return "web_search";
  case Action::FetchUrl:
    return "fetch_url";
  case Action::ExecuteCommand:
    return "execute_command";
  case Action::RunCode:
    return "run_code";
  case Action::SetAssignment:
    return "set_assignment";
  }
  return "unknown";
}

const std::array<Action, kActionCount> &all_actions() {
  static const std::array<Action, kActionCount> actions = {
      Action::SearchKnowledge, Action::AssessUnderstanding, Action::UpdateLearnerProfile,
      Action::LogInteraction,  Action::ReadFile,            Action::ListDirectory,
      Action::IngestDocument,  Action::AnalyzeImage,        Action::WriteFile,
      Action::DeleteFile,      Action::WebSearch,           Action::FetchUrl,
      Action::ExecuteCommand,  Action::RunCode,             Action::SetAssignment,
  };
  return actions;
}

std::optional<Action> action_from_string(const std::string_view name) {
  for (const Action action : all_actions()) {
    if (action_name(action) == name) {
      return action;
    }
  }
  return std::nullopt;
}

} // namespace tutorplane::tools
