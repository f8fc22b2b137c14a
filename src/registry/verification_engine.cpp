#include <verity/registry/verification_engine.hpp>

using namespace verity::schema;

namespace verity::registry {

verification_engine::verification_engine(state_context& state,
                                         role_registry& roles,
                                         identity_store& identities,
                                         credential_store& credentials,
                                         event_log& events)
    : state_{state},
      roles_{roles},
      identities_{identities},
      credentials_{credentials},
      events_{events} {}

operation_status_t verification_engine::verify(const principal_t& caller,
                                               const principal_t& subject,
                                               credential_id_t credential_id) {
  if (!roles_.is_authorized_verifier(caller)) {
    return make_error(transaction_error_code::unauthorized,
                      "caller is not an authorized verifier");
  }
  if (!identities_.exists(subject)) {
    return make_error(transaction_error_code::not_found,
                      "subject has no identity");
  }
  if (credential_id == kGeneralVerification) {
    return verify_identity(caller, subject);
  }
  return check_credential(subject, credential_id);
}

operation_status_t verification_engine::verify_identity(
    const principal_t& caller,
    const principal_t& subject) {
  identities_.record_verification(subject, caller);
  events_.append(audit_event_type_t::identity_verified, caller, subject,
                 std::nullopt, {});
  return std::nullopt;
}

operation_status_t verification_engine::check_credential(
    const principal_t& subject,
    credential_id_t credential_id) const {
  auto record = credentials_.get(credential_id);
  if (!record) {
    return make_error(transaction_error_code::not_found,
                      "credential not found");
  }
  if (record->subject != subject) {
    return make_error(transaction_error_code::credential_subject_mismatch,
                      "credential does not belong to subject");
  }
  switch (credential_status_at(*record, state_.block().time)) {
    case credential_status_t::revoked:
      return make_error(transaction_error_code::credential_invalid,
                        "credential has been revoked");
    case credential_status_t::expired:
      return make_error(transaction_error_code::credential_expired,
                        "credential has expired");
    case credential_status_t::active:
      break;
  }
  return std::nullopt;
}

}  // namespace verity::registry
