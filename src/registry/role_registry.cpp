#include <spdlog/spdlog.h>
#include <verity/registry/role_registry.hpp>
#include <verity/schema/key/engine_keys.hpp>

using namespace verity::schema;

namespace verity::registry {

role_registry::role_registry(state_context& state, event_log& events)
    : state_{state}, events_{events} {}

operation_status_t role_registry::initialize(const principal_t& initiator) {
  if (admin()) {
    return make_error(transaction_error_code::registry_already_initialized,
                      "registry already initialized");
  }
  state_.put(key::make_registry_admin_key(), initiator);
  state_.put(key::make_verifier_key(initiator),
             verifier_grant_t{.verifier = initiator,
                              .authorized_by = initiator,
                              .authorized_at = state_.block().time});
  spdlog::info("Registry admin set to {}", to_string(initiator));
  return std::nullopt;
}

operation_status_t role_registry::authorize_verifier(
    const principal_t& caller,
    const principal_t& target) {
  auto current_admin = admin();
  if (!current_admin) {
    return make_error(transaction_error_code::registry_not_initialized,
                      "registry not initialized");
  }
  if (caller != *current_admin) {
    return make_error(transaction_error_code::unauthorized,
                      "only the admin can authorize verifiers");
  }
  // Re-authorizing keeps the original grant row.
  if (!grant(target)) {
    state_.put(key::make_verifier_key(target),
               verifier_grant_t{.verifier = target,
                                .authorized_by = caller,
                                .authorized_at = state_.block().time});
  }
  events_.append(audit_event_type_t::verifier_authorized, caller, target,
                 std::nullopt, {});
  return std::nullopt;
}

bool role_registry::is_authorized_verifier(const principal_t& principal) const {
  return grant(principal).has_value();
}

std::optional<principal_t> role_registry::admin() const {
  return state_.get<principal_t>(key::make_registry_admin_key());
}

std::optional<verifier_grant_t> role_registry::grant(
    const principal_t& principal) const {
  return state_.get<verifier_grant_t>(key::make_verifier_key(principal));
}

std::vector<verifier_grant_t> role_registry::verifiers() const {
  auto grants = std::vector<verifier_grant_t>{};
  auto rows = state_.list_by_prefix(make_bytes(key::kVerifierKeyPrefix));
  grants.reserve(rows.size());
  for (const auto& [row_key, value] : rows) {
    grants.push_back(
        state_.encoder().decode<verifier_grant_t>(make_bytes_view(value)));
  }
  return grants;
}

}  // namespace verity::registry
