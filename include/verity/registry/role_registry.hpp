#pragma once

#include <verity/registry/event_log.hpp>
#include <verity/registry/operation_error.hpp>
#include <verity/registry/state_context.hpp>
#include <verity/schema/verifier_grant.hpp>
#include <optional>
#include <vector>

namespace verity::registry {

/// Single administrator plus the grow-only set of authorized verifiers.
/// The admin is a verifier from initialization onward.
class role_registry final {
 public:
  role_registry(state_context& state, event_log& events);

  operation_status_t initialize(const verity::schema::principal_t& initiator);

  operation_status_t authorize_verifier(
      const verity::schema::principal_t& caller,
      const verity::schema::principal_t& target);

  bool is_authorized_verifier(
      const verity::schema::principal_t& principal) const;

  std::optional<verity::schema::principal_t> admin() const;

  std::optional<verity::schema::verifier_grant_t> grant(
      const verity::schema::principal_t& principal) const;

  std::vector<verity::schema::verifier_grant_t> verifiers() const;

 private:
  state_context& state_;
  event_log& events_;
};

}  // namespace verity::registry
