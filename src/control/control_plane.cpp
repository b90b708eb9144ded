#include "tutorplane/control/control_plane.hpp"

#include "tutorplane/observability/global.hpp"

#include <chrono>

namespace tutorplane::control {

ControlPlane::ControlPlane(std::shared_ptr<const security::SafetyPolicy> policy,
                           std::shared_ptr<const ActionRouter> router,
                           std::shared_ptr<AuditLog> audit)
    : policy_(std::move(policy)), router_(std::move(router)), audit_(std::move(audit)) {}

std::uint64_t ControlPlane::execution_count() const { return audit_->size(); }

ExecutionEnvelope ControlPlane::execute(const ActionPlan &plan) {
  const auto started = std::chrono::steady_clock::now();

  auto validated = policy_->validate_plan(plan.action, plan.parameters);
  if (!validated.ok()) {
    rejected_.fetch_add(1);
    observability::record_safety_violation(plan.action, validated.error());
    ExecutionEnvelope rejected;
    rejected.success = false;
    rejected.action = plan.action;
    rejected.error = validated.error_info();
    rejected.metadata = ExecutionMetadata{.execution_count = audit_->size(),
                                          .safety_checks_passed = false};
    return rejected;
  }

  const std::string &action = validated.value();
  tools::ToolContext ctx;
  ctx.values = plan.context;
  if (const auto it = plan.context.find("session_id"); it != plan.context.end()) {
    ctx.session_id = it->second;
  }

  tools::ToolResult result = router_->route(action, plan.parameters, ctx);
  const std::uint64_t count = audit_->append(plan, action, result.to_json());

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_action_executed(action, elapsed, result.ok(), count);

  ExecutionEnvelope envelope;
  envelope.success = true;
  envelope.action = action;
  envelope.result = std::move(result);
  envelope.metadata = ExecutionMetadata{.execution_count = count, .safety_checks_passed = true};
  return envelope;
}

} // namespace tutorplane::control
