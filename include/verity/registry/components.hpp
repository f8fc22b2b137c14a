#pragma once

#include <verity/registry/credential_store.hpp>
#include <verity/registry/event_log.hpp>
#include <verity/registry/identity_store.hpp>
#include <verity/registry/role_registry.hpp>
#include <verity/registry/state_context.hpp>
#include <verity/registry/verification_engine.hpp>

namespace verity::registry {

/// Registry components wired over one state_context.
struct components final {
  explicit components(state_context& state)
      : events{state},
        roles{state, events},
        identities{state, events},
        credentials{state, roles, identities, events},
        verification{state, roles, identities, credentials, events} {}

  components(const components&) = delete;
  components& operator=(const components&) = delete;

  event_log events;
  role_registry roles;
  identity_store identities;
  credential_store credentials;
  verification_engine verification;
};

}  // namespace verity::registry
