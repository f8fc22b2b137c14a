#include <spdlog/spdlog.h>
#include <verity/registry/credential_store.hpp>
#include <verity/schema/key/engine_keys.hpp>

#include <algorithm>
#include <limits>

using namespace verity::schema;

namespace verity::registry {

credential_store::credential_store(state_context& state,
                                   role_registry& roles,
                                   identity_store& identities,
                                   event_log& events)
    : state_{state}, roles_{roles}, identities_{identities}, events_{events} {}

operation_result_t<credential_id_t> credential_store::issue(
    const principal_t& caller,
    const principal_t& subject,
    const std::string& credential_type,
    const std::string& data,
    duration_seconds_t expiration_duration) {
  if (!roles_.is_authorized_verifier(caller)) {
    return make_error(transaction_error_code::unauthorized,
                      "caller is not an authorized verifier");
  }
  if (!identities_.exists(subject)) {
    return make_error(transaction_error_code::not_found,
                      "subject has no identity");
  }
  if (credential_type.empty() || data.empty()) {
    return make_error(transaction_error_code::invalid_input,
                      "credential type and data must be non-empty");
  }
  auto now = state_.block().time;
  if (expiration_duration > std::numeric_limits<timestamp_seconds_t>::max() -
                                now) {
    return make_error(transaction_error_code::invalid_input,
                      "expiration overflows timestamp range");
  }

  auto id = total() + 1;
  auto record = credential_record_t{};
  record.id = id;
  record.issuer = caller;
  record.subject = subject;
  record.credential_type = credential_type;
  record.data = data;
  record.issued_at = now;
  record.expires_at = now + expiration_duration;
  record.is_valid = true;

  state_.put(key::make_credential_key(id), record);
  state_.put(key::make_credential_sequence_key(), id);
  state_.put(key::make_subject_credential_key(subject, id), true);
  events_.append(audit_event_type_t::credential_issued, caller, subject, id,
                 credential_type);
  spdlog::debug("Issued credential {} of type '{}' to {}", id,
                credential_type, to_string(subject));
  return id;
}

operation_status_t credential_store::revoke(const principal_t& caller,
                                            credential_id_t credential_id) {
  auto record = get(credential_id);
  // An unknown id has no issuer the caller could match.
  if (!record || record->issuer != caller) {
    return make_error(transaction_error_code::unauthorized,
                      "only the issuer can revoke a credential");
  }
  record->is_valid = false;
  state_.put(key::make_credential_key(credential_id), *record);
  events_.append(audit_event_type_t::credential_revoked, caller,
                 record->subject, credential_id, {});
  return std::nullopt;
}

std::optional<credential_record_t> credential_store::get(
    credential_id_t credential_id) const {
  return state_.get<credential_record_t>(
      key::make_credential_key(credential_id));
}

uint64_t credential_store::total() const {
  return state_.get<uint64_t>(key::make_credential_sequence_key())
      .value_or(0);
}

std::vector<credential_id_t> credential_store::ids_for_subject(
    const principal_t& subject) const {
  auto ids = std::vector<credential_id_t>{};
  for (const auto& [row_key, value] : state_.list_by_prefix(
           key::make_subject_credential_prefix_key(subject))) {
    if (auto id = key::parse_subject_credential_key(make_bytes_view(row_key),
                                                    subject)) {
      ids.push_back(*id);
    }
  }
  // SCALE integers are little-endian, so key order is not numeric order.
  std::sort(std::begin(ids), std::end(ids));
  return ids;
}

std::optional<credential_status_t> credential_store::status(
    credential_id_t credential_id,
    timestamp_seconds_t now) const {
  auto record = get(credential_id);
  if (!record) {
    return std::nullopt;
  }
  return credential_status_at(*record, now);
}

credential_status_t credential_status_at(const credential_record_t& record,
                                         timestamp_seconds_t now) {
  if (!record.is_valid) {
    return credential_status_t::revoked;
  }
  if (now > record.expires_at) {
    return credential_status_t::expired;
  }
  return credential_status_t::active;
}

}  // namespace verity::registry
