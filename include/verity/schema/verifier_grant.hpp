#pragma once
#include <verity/schema/primitives.hpp>

// Schema type: verifier grant.
// Registry workflow: membership row of the authorized verifier set. Rows are
// only ever added; the admin's own row is written at genesis.
namespace verity::schema {

template <uint16_t Version>
struct verifier_grant;

template <>
struct verifier_grant<1> final {
  uint16_t version{1};
  principal_t verifier;
  principal_t authorized_by;
  timestamp_seconds_t authorized_at{};
};

using verifier_grant_t = verifier_grant<1>;

}  // namespace verity::schema
