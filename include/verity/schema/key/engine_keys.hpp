#pragma once

#include <verity/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema key type: engine keys.
// Registry workflow: canonical key prefixes and key codecs for registry state,
// audit events, and transaction history. Keys are a raw ASCII prefix followed
// by the SCALE encoding of the record id, so every keyspace is prefix-scannable.
namespace verity::schema::key {

extern const std::string_view kStatePrefix;
extern const std::string_view kRegistryKeyPrefix;
extern const std::string_view kVerifierKeyPrefix;
extern const std::string_view kIdentityKeyPrefix;
extern const std::string_view kCredentialKeyPrefix;
extern const std::string_view kCredentialSeqKeyPrefix;
extern const std::string_view kSubjectCredentialKeyPrefix;
extern const std::string_view kNonceKeyPrefix;
extern const std::string_view kEventSeqKeyPrefix;
extern const std::string_view kHistoryPrefix;
extern const std::string_view kEventPrefix;

extern const std::array<std::string_view, 11> kEngineKeyspaces;

verity::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const verity::schema::bytes_t& id);

verity::schema::bytes_t make_registry_admin_key();

verity::schema::bytes_t make_verifier_key(
    const verity::schema::principal_t& verifier);

verity::schema::bytes_t make_identity_key(
    const verity::schema::principal_t& owner);

verity::schema::bytes_t make_credential_key(
    verity::schema::credential_id_t credential_id);

verity::schema::bytes_t make_credential_sequence_key();

verity::schema::bytes_t make_subject_credential_key(
    const verity::schema::principal_t& subject,
    verity::schema::credential_id_t credential_id);

/// Prefix shared by every index row of one subject.
verity::schema::bytes_t make_subject_credential_prefix_key(
    const verity::schema::principal_t& subject);

verity::schema::bytes_t make_nonce_key(
    const verity::schema::signer_id_t& signer);

verity::schema::bytes_t make_event_sequence_key();

verity::schema::bytes_t make_history_key(uint64_t height, uint32_t index);

verity::schema::bytes_t make_event_key(uint64_t event_id);

std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    const verity::schema::bytes_view_t& key);

std::optional<uint64_t> parse_event_key(
    const verity::schema::bytes_view_t& key);

std::optional<verity::schema::credential_id_t> parse_subject_credential_key(
    const verity::schema::bytes_view_t& key,
    const verity::schema::principal_t& subject);

}  // namespace verity::schema::key
