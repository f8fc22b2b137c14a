#pragma once
#include <verity/schema/primitives.hpp>

#include <string>

// Schema type: credential record.
// Registry workflow: issuer-attributed claim about a subject. `data` is an
// opaque reference into off-chain content-addressed storage. Expiry is derived
// on read from `expires_at`; only `is_valid` is ever mutated (by revocation).
namespace verity::schema {

template <uint16_t Version>
struct credential_record;

template <>
struct credential_record<1> final {
  uint16_t version{1};
  credential_id_t id{};
  principal_t issuer;
  principal_t subject;
  std::string credential_type;
  std::string data;
  timestamp_seconds_t issued_at{};
  timestamp_seconds_t expires_at{};
  bool is_valid{true};
};

using credential_record_t = credential_record<1>;

}  // namespace verity::schema
