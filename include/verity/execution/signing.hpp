#pragma once

#include <verity/schema/primitives.hpp>
#include <verity/schema/transaction.hpp>

namespace verity::execution {

inline constexpr std::string_view kChainIdSeed{"verity-registry-chain"};

/// blake3 of the fixed chain seed. Every transaction must carry it.
verity::schema::hash32_t registry_chain_id();

/// Bytes covered by the transaction signature: SCALE of
/// (version, chain_id, nonce, signer, payload).
verity::schema::bytes_t make_signing_message(
    const verity::schema::transaction_t& tx);

/// Whether the signature variant can belong to the signer's key type.
bool signature_matches_signer(const verity::schema::signer_id_t& signer,
                              const verity::schema::signature_t& signature);

}  // namespace verity::execution
