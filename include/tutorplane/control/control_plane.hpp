#pragma once

#include "tutorplane/control/action_plan.hpp"
#include "tutorplane/control/action_router.hpp"
#include "tutorplane/control/audit_log.hpp"
#include "tutorplane/security/policy.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace tutorplane::control {

/// Validates a plan against the safety policy, routes it, and records one
/// audit entry per routed execution. Safe to call from several threads.
class ControlPlane {
public:
  /// All three collaborators must be non-null.
  ControlPlane(std::shared_ptr<const security::SafetyPolicy> policy,
               std::shared_ptr<const ActionRouter> router, std::shared_ptr<AuditLog> audit);

  /// Rejected plans come back with success == false and leave the audit log
  /// untouched. Tool-level errors are still successful executions.
  [[nodiscard]] ExecutionEnvelope execute(const ActionPlan &plan);

  [[nodiscard]] std::uint64_t execution_count() const;
  [[nodiscard]] std::uint64_t rejected_count() const { return rejected_.load(); }
  [[nodiscard]] const AuditLog &audit_log() const { return *audit_; }
  [[nodiscard]] const security::SafetyPolicy &policy() const { return *policy_; }

private:
  std::shared_ptr<const security::SafetyPolicy> policy_;
  std::shared_ptr<const ActionRouter> router_;
  std::shared_ptr<AuditLog> audit_;
  std::atomic<std::uint64_t> rejected_{0};
};

} // namespace tutorplane::control
