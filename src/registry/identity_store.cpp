#include <spdlog/spdlog.h>
#include <verity/common/critical.hpp>
#include <verity/registry/identity_store.hpp>
#include <verity/schema/key/engine_keys.hpp>

#include <algorithm>

using namespace verity::schema;

namespace verity::registry {

identity_store::identity_store(state_context& state, event_log& events)
    : state_{state}, events_{events} {}

operation_status_t identity_store::create_identity(const principal_t& caller,
                                                   const std::string& name,
                                                   const std::string& email) {
  if (exists(caller)) {
    return make_error(transaction_error_code::already_exists,
                      "identity already exists");
  }
  if (name.empty() || email.empty()) {
    return make_error(transaction_error_code::invalid_input,
                      "name and email must be non-empty");
  }

  auto record = identity_record_t{};
  record.owner = caller;
  record.name = name;
  record.email = email;
  record.created_at = state_.block().time;
  state_.put(key::make_identity_key(caller), record);

  events_.append(audit_event_type_t::identity_created, caller, caller,
                 std::nullopt, name);
  return std::nullopt;
}

std::optional<identity_record_t> identity_store::get_identity(
    const principal_t& principal) const {
  return state_.get<identity_record_t>(key::make_identity_key(principal));
}

bool identity_store::exists(const principal_t& principal) const {
  return get_identity(principal).has_value();
}

void identity_store::record_verification(const principal_t& subject,
                                         const principal_t& verifier) {
  auto record = get_identity(subject);
  if (!record) {
    verity::common::critical("verification recorded for missing identity");
  }
  record->is_verified = true;
  auto position = std::lower_bound(std::begin(record->verifiers),
                                   std::end(record->verifiers), verifier);
  if (position == std::end(record->verifiers) || *position != verifier) {
    record->verifiers.insert(position, verifier);
  }
  state_.put(key::make_identity_key(subject), *record);
  spdlog::debug("Identity {} verified by {}", to_string(subject),
                to_string(verifier));
}

}  // namespace verity::registry
