#pragma once
#include <verity/schema/primitives.hpp>

#include <string>

// Schema type: issue credential.
// Registry workflow: an authorized verifier attests a claim about a subject
// that already holds an identity. A zero duration expires immediately.
namespace verity::schema {

template <uint16_t Version>
struct issue_credential;

template <>
struct issue_credential<1> final {
  uint16_t version{1};
  principal_t subject;
  std::string credential_type;
  std::string data;
  duration_seconds_t expiration_duration{};
};

using issue_credential_t = issue_credential<1>;

}  // namespace verity::schema
