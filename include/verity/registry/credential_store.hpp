#pragma once

#include <verity/registry/event_log.hpp>
#include <verity/registry/identity_store.hpp>
#include <verity/registry/operation_error.hpp>
#include <verity/registry/role_registry.hpp>
#include <verity/registry/state_context.hpp>
#include <verity/schema/credential_record.hpp>
#include <verity/schema/credential_status.hpp>
#include <optional>
#include <string>
#include <vector>

namespace verity::registry {

/// Credentials keyed by a strictly increasing id starting at 1. Ids are
/// consumed only by successful issuance and never reused.
class credential_store final {
 public:
  credential_store(state_context& state,
                   role_registry& roles,
                   identity_store& identities,
                   event_log& events);

  operation_result_t<verity::schema::credential_id_t> issue(
      const verity::schema::principal_t& caller,
      const verity::schema::principal_t& subject,
      const std::string& credential_type,
      const std::string& data,
      verity::schema::duration_seconds_t expiration_duration);

  /// Issuer-only. Revoking twice succeeds and leaves the credential revoked.
  operation_status_t revoke(const verity::schema::principal_t& caller,
                            verity::schema::credential_id_t credential_id);

  std::optional<verity::schema::credential_record_t> get(
      verity::schema::credential_id_t credential_id) const;

  /// Issuance counter; equals the highest id handed out.
  uint64_t total() const;

  std::vector<verity::schema::credential_id_t> ids_for_subject(
      const verity::schema::principal_t& subject) const;

  /// Derived usability at `now`; expiry is never stored.
  std::optional<verity::schema::credential_status_t> status(
      verity::schema::credential_id_t credential_id,
      verity::schema::timestamp_seconds_t now) const;

 private:
  state_context& state_;
  role_registry& roles_;
  identity_store& identities_;
  event_log& events_;
};

/// Status of `record` at `now`. Valid through `expires_at` inclusive.
verity::schema::credential_status_t credential_status_at(
    const verity::schema::credential_record_t& record,
    verity::schema::timestamp_seconds_t now);

}  // namespace verity::registry
