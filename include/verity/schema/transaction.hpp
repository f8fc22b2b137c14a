#pragma once
#include <verity/schema/authorize_verifier.hpp>
#include <verity/schema/create_identity.hpp>
#include <verity/schema/issue_credential.hpp>
#include <verity/schema/primitives.hpp>
#include <verity/schema/revoke_credential.hpp>
#include <verity/schema/verify_identity.hpp>
#include <variant>

namespace verity::schema {

using transaction_payload_t = std::variant<create_identity_t,
                                           authorize_verifier_t,
                                           issue_credential_t,
                                           verify_identity_t,
                                           revoke_credential_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace verity::schema
