#include <verity/blake3/hash.hpp>
#include <verity/execution/signing.hpp>
#include <verity/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace verity::execution {

namespace {

using encoder_t = verity::schema::encoding::encoder<
    verity::schema::encoding::scale_encoder_tag>;

}  // namespace

verity::schema::hash32_t registry_chain_id() {
  return verity::blake3::hash(kChainIdSeed);
}

verity::schema::bytes_t make_signing_message(
    const verity::schema::transaction_t& tx) {
  return encoder_t{}.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

bool signature_matches_signer(const verity::schema::signer_id_t& signer,
                              const verity::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const verity::schema::ed25519_signer_id&) {
            return std::holds_alternative<verity::schema::ed25519_signature_t>(
                signature);
          },
          [&](const verity::schema::secp256k1_signer_id&) {
            return std::holds_alternative<
                verity::schema::secp256k1_signature_t>(signature);
          },
          [](const verity::schema::named_signer_t&) { return true; }},
      signer);
}

}  // namespace verity::execution
