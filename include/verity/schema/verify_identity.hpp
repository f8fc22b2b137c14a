#pragma once
#include <verity/schema/primitives.hpp>

// Schema type: verify identity.
// Registry workflow: `credential_id == kGeneralVerification` attests the
// identity as a whole (stateful); any other id checks one credential
// (read-only).
namespace verity::schema {

inline constexpr credential_id_t kGeneralVerification{0};

template <uint16_t Version>
struct verify_identity;

template <>
struct verify_identity<1> final {
  uint16_t version{1};
  principal_t subject;
  credential_id_t credential_id{kGeneralVerification};
};

using verify_identity_t = verify_identity<1>;

}  // namespace verity::schema
