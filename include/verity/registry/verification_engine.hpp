#pragma once

#include <verity/registry/credential_store.hpp>
#include <verity/registry/event_log.hpp>
#include <verity/registry/identity_store.hpp>
#include <verity/registry/operation_error.hpp>
#include <verity/registry/role_registry.hpp>
#include <verity/schema/verify_identity.hpp>

namespace verity::registry {

/// Two-mode verification.
///
/// With `credential_id == kGeneralVerification` the subject's identity is
/// marked verified and the caller joins its verifier set; a single authorized
/// verifier is sufficient. With any other id the credential is checked for
/// subject, revocation and expiry at the current block time, and no state is
/// touched.
class verification_engine final {
 public:
  verification_engine(state_context& state,
                      role_registry& roles,
                      identity_store& identities,
                      credential_store& credentials,
                      event_log& events);

  operation_status_t verify(const verity::schema::principal_t& caller,
                            const verity::schema::principal_t& subject,
                            verity::schema::credential_id_t credential_id);

 private:
  operation_status_t verify_identity(
      const verity::schema::principal_t& caller,
      const verity::schema::principal_t& subject);

  operation_status_t check_credential(
      const verity::schema::principal_t& subject,
      verity::schema::credential_id_t credential_id) const;

  state_context& state_;
  role_registry& roles_;
  identity_store& identities_;
  credential_store& credentials_;
  event_log& events_;
};

}  // namespace verity::registry
