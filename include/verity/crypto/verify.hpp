#pragma once

#include <verity/schema/primitives.hpp>
#include <optional>

namespace verity::crypto {

enum class verify_status : uint8_t {
  verified = 0,
  // Signature variant does not match the signer's key type.
  signature_type_mismatch = 1,
  // Named signers carry no key material.
  unverifiable_signer = 2,
  invalid_signature = 3
};

bool available();

verify_status check_signature(const verity::schema::bytes_view_t& message,
                              const verity::schema::signer_id_t& signer,
                              const verity::schema::signature_t& signature);

bool verify_signature(const verity::schema::bytes_view_t& message,
                      const verity::schema::signer_id_t& signer,
                      const verity::schema::signature_t& signature);

/// Derive the ed25519 public key of a 32-byte private seed.
std::optional<verity::schema::ed25519_signer_id> ed25519_public_key(
    const verity::schema::hash32_t& seed);

/// Sign message with a 32-byte ed25519 private seed.
std::optional<verity::schema::ed25519_signature_t> sign_ed25519(
    const verity::schema::bytes_view_t& message,
    const verity::schema::hash32_t& seed);

}  // namespace verity::crypto
