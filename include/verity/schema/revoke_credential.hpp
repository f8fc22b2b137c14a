#pragma once
#include <verity/schema/primitives.hpp>

// Schema type: revoke credential.
// Registry workflow: issuer-only, one-way invalidation.
namespace verity::schema {

template <uint16_t Version>
struct revoke_credential;

template <>
struct revoke_credential<1> final {
  uint16_t version{1};
  credential_id_t credential_id{};
};

using revoke_credential_t = revoke_credential<1>;

}  // namespace verity::schema
