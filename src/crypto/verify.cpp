#include <verity/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace verity::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool has_provider(EVP_PKEY_CTX* raw) {
  auto ctx = evp_pkey_ctx_ptr{raw, EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

evp_pkey_ptr make_ed25519_private_key(const verity::schema::hash32_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   seed.data(), seed.size()),
                      EVP_PKEY_free};
}

bool digest_verify(EVP_PKEY* pkey,
                   const EVP_MD* digest,
                   const verity::schema::bytes_view_t& signature,
                   const verity::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

bool verify_ed25519(const verity::schema::bytes_view_t& message,
                    const verity::schema::ed25519_signer_id& signer,
                    const verity::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey.get(), nullptr, signature, message);
}

// 65-byte secp256k1 signatures carry a recovery id on one side: either
// [v || r || s] or [r || s || v]. Recovery ids are 0..3 or 27 and above.
std::optional<std::array<uint8_t, 64>> compact_secp_signature(
    const verity::schema::secp256k1_signature_t& signature) {
  auto out = std::array<uint8_t, 64>{};
  if (signature[0] <= 3 || signature[0] >= 27) {
    std::copy_n(signature.data() + 1, out.size(), out.data());
    return out;
  }
  if (signature[64] <= 3 || signature[64] >= 27) {
    std::copy_n(signature.data(), out.size(), out.data());
    return out;
  }
  return std::nullopt;
}

evp_pkey_ptr make_secp256k1_public_key(
    const verity::schema::secp256k1_signer_id& signer) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

std::optional<std::vector<uint8_t>> der_encode(
    const std::array<uint8_t, 64>& compact) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return std::nullopt;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

bool verify_secp256k1(const verity::schema::bytes_view_t& message,
                      const verity::schema::secp256k1_signer_id& signer,
                      const verity::schema::secp256k1_signature_t& signature) {
  auto compact = compact_secp_signature(signature);
  if (!compact) {
    return false;
  }
  auto der = der_encode(*compact);
  if (!der) {
    return false;
  }
  auto pkey = make_secp256k1_public_key(signer);
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey.get(), EVP_sha256(), *der, message);
}

}  // namespace

bool available() {
  static const auto available_now =
      has_provider(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr)) &&
      has_provider(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
  return available_now;
}

verify_status check_signature(const verity::schema::bytes_view_t& message,
                              const verity::schema::signer_id_t& signer,
                              const verity::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const verity::schema::ed25519_signer_id& value) {
            const auto* sig =
                std::get_if<verity::schema::ed25519_signature_t>(&signature);
            if (sig == nullptr) {
              return verify_status::signature_type_mismatch;
            }
            return verify_ed25519(message, value, *sig)
                       ? verify_status::verified
                       : verify_status::invalid_signature;
          },
          [&](const verity::schema::secp256k1_signer_id& value) {
            const auto* sig =
                std::get_if<verity::schema::secp256k1_signature_t>(&signature);
            if (sig == nullptr) {
              return verify_status::signature_type_mismatch;
            }
            return verify_secp256k1(message, value, *sig)
                       ? verify_status::verified
                       : verify_status::invalid_signature;
          },
          [](const verity::schema::named_signer_t&) {
            return verify_status::unverifiable_signer;
          }},
      signer);
}

bool verify_signature(const verity::schema::bytes_view_t& message,
                      const verity::schema::signer_id_t& signer,
                      const verity::schema::signature_t& signature) {
  return check_signature(message, signer, signature) ==
         verify_status::verified;
}

std::optional<verity::schema::ed25519_signer_id> ed25519_public_key(
    const verity::schema::hash32_t& seed) {
  auto pkey = make_ed25519_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto signer = verity::schema::ed25519_signer_id{};
  auto size = signer.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), signer.public_key.data(),
                                  &size) != 1 ||
      size != signer.public_key.size()) {
    return std::nullopt;
  }
  return signer;
}

std::optional<verity::schema::ed25519_signature_t> sign_ed25519(
    const verity::schema::bytes_view_t& message,
    const verity::schema::hash32_t& seed) {
  auto pkey = make_ed25519_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    return std::nullopt;
  }
  auto signature = verity::schema::ed25519_signature_t{};
  auto size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size()) != 1 ||
      size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace verity::crypto
