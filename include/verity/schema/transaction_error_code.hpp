#pragma once

#include <cstdint>

namespace verity::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  registry_not_initialized = 7,
  registry_already_initialized = 8,
  unauthorized = 10,
  already_exists = 11,
  not_found = 12,
  invalid_input = 13,
  credential_subject_mismatch = 14,
  credential_invalid = 15,
  credential_expired = 16,
};

}  // namespace verity::schema
