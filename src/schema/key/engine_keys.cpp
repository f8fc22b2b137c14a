#include <verity/schema/key/engine_keys.hpp>

#include <verity/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <tuple>

namespace verity::schema::key {

namespace {

using key_encoder_t = verity::schema::encoding::encoder<
    verity::schema::encoding::scale_encoder_tag>;

std::optional<verity::schema::bytes_view_t> strip_prefix(
    const verity::schema::bytes_view_t& key,
    const verity::schema::bytes_view_t& prefix) {
  if (key.size() < prefix.size() ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  return key.subspan(prefix.size());
}

}  // namespace

const std::string_view kStatePrefix{"SYS|STATE|"};
const std::string_view kRegistryKeyPrefix{"SYS|STATE|REGISTRY|"};
const std::string_view kVerifierKeyPrefix{"SYS|STATE|VERIFIER|"};
const std::string_view kIdentityKeyPrefix{"SYS|STATE|IDENTITY|"};
const std::string_view kCredentialKeyPrefix{"SYS|STATE|CREDENTIAL|"};
const std::string_view kCredentialSeqKeyPrefix{"SYS|STATE|CREDENTIAL_SEQ|"};
const std::string_view kSubjectCredentialKeyPrefix{
    "SYS|STATE|SUBJECT_CREDENTIAL|"};
const std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
const std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
const std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
const std::string_view kEventPrefix{"SYS|EVENT|"};

const std::array<std::string_view, 11> kEngineKeyspaces{
    kStatePrefix,
    kRegistryKeyPrefix,
    kVerifierKeyPrefix,
    kIdentityKeyPrefix,
    kCredentialKeyPrefix,
    kCredentialSeqKeyPrefix,
    kSubjectCredentialKeyPrefix,
    kNonceKeyPrefix,
    kEventSeqKeyPrefix,
    kHistoryPrefix,
    kEventPrefix};

verity::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const verity::schema::bytes_t& id) {
  auto key = verity::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

verity::schema::bytes_t make_registry_admin_key() {
  return make_prefixed_key(kRegistryKeyPrefix, verity::schema::make_bytes(
                                                   std::string_view{"ADMIN"}));
}

verity::schema::bytes_t make_verifier_key(
    const verity::schema::principal_t& verifier) {
  return make_prefixed_key(kVerifierKeyPrefix,
                           key_encoder_t{}.encode(verifier));
}

verity::schema::bytes_t make_identity_key(
    const verity::schema::principal_t& owner) {
  return make_prefixed_key(kIdentityKeyPrefix, key_encoder_t{}.encode(owner));
}

verity::schema::bytes_t make_credential_key(
    verity::schema::credential_id_t credential_id) {
  return make_prefixed_key(kCredentialKeyPrefix,
                           key_encoder_t{}.encode(credential_id));
}

verity::schema::bytes_t make_credential_sequence_key() {
  return make_prefixed_key(
      kCredentialSeqKeyPrefix,
      verity::schema::make_bytes(std::string_view{"NEXT"}));
}

verity::schema::bytes_t make_subject_credential_key(
    const verity::schema::principal_t& subject,
    verity::schema::credential_id_t credential_id) {
  return make_prefixed_key(
      kSubjectCredentialKeyPrefix,
      key_encoder_t{}.encode(std::tuple{subject, credential_id}));
}

verity::schema::bytes_t make_subject_credential_prefix_key(
    const verity::schema::principal_t& subject) {
  return make_prefixed_key(kSubjectCredentialKeyPrefix,
                           key_encoder_t{}.encode(subject));
}

verity::schema::bytes_t make_nonce_key(
    const verity::schema::signer_id_t& signer) {
  return make_prefixed_key(kNonceKeyPrefix, key_encoder_t{}.encode(signer));
}

verity::schema::bytes_t make_event_sequence_key() {
  return make_prefixed_key(kEventSeqKeyPrefix, verity::schema::make_bytes(
                                                   std::string_view{"NEXT"}));
}

verity::schema::bytes_t make_history_key(uint64_t height, uint32_t index) {
  return make_prefixed_key(kHistoryPrefix,
                           key_encoder_t{}.encode(std::tuple{height, index}));
}

verity::schema::bytes_t make_event_key(uint64_t event_id) {
  return make_prefixed_key(kEventPrefix, key_encoder_t{}.encode(event_id));
}

std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    const verity::schema::bytes_view_t& key) {
  auto encoded =
      strip_prefix(key, verity::schema::make_bytes_view(kHistoryPrefix));
  if (!encoded) {
    return std::nullopt;
  }
  auto decoded =
      key_encoder_t{}.try_decode<std::tuple<uint64_t, uint32_t>>(*encoded);
  if (!decoded) {
    return std::nullopt;
  }
  return std::pair<uint64_t, uint32_t>{std::get<0>(decoded.value()),
                                       std::get<1>(decoded.value())};
}

std::optional<uint64_t> parse_event_key(
    const verity::schema::bytes_view_t& key) {
  auto encoded =
      strip_prefix(key, verity::schema::make_bytes_view(kEventPrefix));
  if (!encoded) {
    return std::nullopt;
  }
  return key_encoder_t{}.try_decode<uint64_t>(*encoded);
}

std::optional<verity::schema::credential_id_t> parse_subject_credential_key(
    const verity::schema::bytes_view_t& key,
    const verity::schema::principal_t& subject) {
  auto prefix = make_subject_credential_prefix_key(subject);
  auto encoded = strip_prefix(key, verity::schema::make_bytes_view(prefix));
  if (!encoded) {
    return std::nullopt;
  }
  return key_encoder_t{}.try_decode<verity::schema::credential_id_t>(*encoded);
}

}  // namespace verity::schema::key
