#include "tutorplane/tools/builtin/tutoring.hpp"

#include "tutorplane/common/fs.hpp"

#include <map>

namespace tutorplane::tools {

namespace {

std::string profile_json(const store::LearnerProfile &profile) {
  return common::json_object({
      {"proficiency", common::json_quote(profile.proficiency)},
      {"topics_covered", common::json_string_array(profile.topics_covered)},
  });
}

} // namespace

std::vector<std::string> assessment_questions(const std::string &topic) {
  static const std::map<std::string, std::vector<std::string>> bank = {
      {"python", {"what keyword defines a function?", "how do you create a variable?"}},
      {"ml", {"what is supervised learning?", "name two types of ml algorithms."}},
      {"math", {"what is a vector?", "explain matrix multiplication."}},
  };
  const auto it = bank.find(common::to_lower(common::trim(topic)));
  if (it == bank.end()) {
    return {"general comprehension check."};
  }
  return it->second;
}

std::string_view AssessUnderstandingTool::description() const {
  return "Return assessment questions for a topic";
}

std::string AssessUnderstandingTool::parameters_schema() const {
  return R"({"type":"object","required":["topic"],"properties":{"topic":{"type":"string"}}})";
}

common::Result<ToolResult> AssessUnderstandingTool::execute(const ToolArgs &args,
                                                            const ToolContext &) {
  auto topic = required_arg(args, "topic");
  if (!topic.ok()) {
    return common::Result<ToolResult>::failure(topic.error_info());
  }

  ToolResult result = make_result();
  result.set_string("topic", topic.value());
  result.set_raw("questions", common::json_string_array(assessment_questions(topic.value())));
  return common::Result<ToolResult>::success(std::move(result));
}

UpdateLearnerProfileTool::UpdateLearnerProfileTool(std::shared_ptr<store::ITutorStore> store)
    : store_(std::move(store)) {}

std::string_view UpdateLearnerProfileTool::description() const {
  return "Record the learner's proficiency and the topic being studied";
}

std::string UpdateLearnerProfileTool::parameters_schema() const {
  return R"({"type":"object","required":["topic","proficiency"],"properties":{"topic":{"type":"string"},"proficiency":{"type":"string","enum":["fundamental","intermediate","expert"]}}})";
}

common::Result<ToolResult> UpdateLearnerProfileTool::execute(const ToolArgs &args,
                                                             const ToolContext &) {
  if (!store_) {
    return common::Result<ToolResult>::failure("tutor store unavailable");
  }
  auto topic = required_arg(args, "topic");
  if (!topic.ok()) {
    return common::Result<ToolResult>::failure(topic.error_info());
  }
  auto proficiency = required_arg(args, "proficiency");
  if (!proficiency.ok()) {
    return common::Result<ToolResult>::failure(proficiency.error_info());
  }

  auto updated = store_->update_profile(common::trim(proficiency.value()),
                                        common::trim(topic.value()));
  if (!updated.ok()) {
    return common::Result<ToolResult>::failure(updated.error_info());
  }

  ToolResult result = make_result("updated");
  result.set_raw("profile", profile_json(updated.value()));
  return common::Result<ToolResult>::success(std::move(result));
}

LogInteractionTool::LogInteractionTool(std::shared_ptr<store::ITutorStore> store)
    : store_(std::move(store)) {}

std::string_view LogInteractionTool::description() const {
  return "Persist an interaction event with JSON details";
}

std::string LogInteractionTool::parameters_schema() const {
  return R"({"type":"object","required":["event"],"properties":{"event":{"type":"string"},"details":{"type":"object"}}})";
}

common::Result<ToolResult> LogInteractionTool::execute(const ToolArgs &args, const ToolContext &) {
  if (!store_) {
    return common::Result<ToolResult>::failure("tutor store unavailable");
  }
  auto event = required_arg(args, "event");
  if (!event.ok()) {
    return common::Result<ToolResult>::failure(event.error_info());
  }

  // Objects are stored as given; any other text is stored as a JSON string.
  std::string details = common::trim(optional_arg(args, "details", "{}"));
  if (!details.empty() && details.front() == '{') {
    auto parsed = common::json_parse_flat(details);
    if (!parsed.ok()) {
      return common::Result<ToolResult>::failure(common::ErrorKind::InvalidArguments,
                                                 "details must be a JSON object: " +
                                                     parsed.error());
    }
  } else {
    details = common::json_quote(details);
  }

  auto entry_id = store_->log_interaction(event.value(), details);
  if (!entry_id.ok()) {
    return common::Result<ToolResult>::failure(entry_id.error_info());
  }

  ToolResult result = make_result("logged");
  result.set_int("entry_id", entry_id.value());
  return common::Result<ToolResult>::success(std::move(result));
}

std::string_view SetAssignmentTool::description() const {
  return "Set a coding assignment for the learner's workspace";
}

std::string SetAssignmentTool::parameters_schema() const {
  return R"({"type":"object","required":["description"],"properties":{"description":{"type":"string"},"language":{"type":"string","default":"python"}}})";
}

common::Result<ToolResult> SetAssignmentTool::execute(const ToolArgs &args, const ToolContext &) {
  auto description = required_arg(args, "description");
  if (!description.ok()) {
    return common::Result<ToolResult>::failure(description.error_info());
  }

  ToolResult result = make_result("assignment_set");
  result.set_string("description", description.value());
  result.set_string("language", optional_arg(args, "language", "python"));
  result.set_string("message", "Assignment has been set in the coding workspace.");
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace tutorplane::tools
