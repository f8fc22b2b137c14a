#include <gtest/gtest.h>
#include <verity/crypto/verify.hpp>
#include <verity/schema/identity_record.hpp>
#include <verity/testing/execution_fixture.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace {

using verity::schema::transaction_error_code;
using verity::testing::execution_fixture;
using verity::testing::make_named_principal;

uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

verity::schema::create_identity_t make_identity(const std::string& name) {
  return verity::schema::create_identity_t{.name = name,
                                           .email = name + "@example.org"};
}

verity::schema::hash32_t make_seed(const uint8_t seed) {
  return verity::testing::make_hash(seed);
}

/// Sign `tx` in place with the ed25519 key derived from `seed`.
bool sign(verity::schema::transaction_t& tx,
          const verity::schema::hash32_t& seed) {
  auto public_key = verity::crypto::ed25519_public_key(seed);
  if (!public_key) {
    return false;
  }
  tx.signer = *public_key;
  auto message = verity::execution::make_signing_message(tx);
  auto signature = verity::crypto::sign_ed25519(
      verity::schema::bytes_view_t{message}, seed);
  if (!signature) {
    return false;
  }
  tx.signature = *signature;
  return true;
}

verity::schema::transaction_result_t check(
    verity::execution::engine& engine,
    const verity::schema::transaction_t& tx) {
  auto raw = verity::testing::encode_transaction(tx);
  return engine.check_transaction(verity::schema::bytes_view_t{raw});
}

}  // namespace

TEST(engine_envelope, transactions_before_genesis_are_rejected) {
  auto fixture = execution_fixture{"verity_envelope_uninitialized"};
  auto alice = make_named_principal(3);

  auto tx = verity::testing::make_transaction(1, alice, make_identity("alice"));
  auto checked = check(fixture.engine(), tx);
  EXPECT_EQ(checked.code,
            code_of(transaction_error_code::registry_not_initialized));
  EXPECT_EQ(checked.codespace, "verity.checktx");

  auto result = fixture.submit(alice, make_identity("alice"));
  EXPECT_EQ(result.code,
            code_of(transaction_error_code::registry_not_initialized));
  EXPECT_EQ(result.codespace, "verity.finalize");
}

TEST(engine_envelope, malformed_envelopes_are_rejected) {
  auto fixture = execution_fixture{"verity_envelope_malformed"};
  auto admin = make_named_principal(1);
  ASSERT_EQ(fixture.init(admin).code, 0u);
  auto& engine = fixture.engine();

  auto empty = verity::schema::bytes_t{};
  EXPECT_EQ(engine.check_transaction(verity::schema::bytes_view_t{empty}).code,
            code_of(transaction_error_code::invalid_transaction));
  auto garbage = verity::schema::bytes_t{0x07, 0x01, 0x02};
  EXPECT_EQ(
      engine.check_transaction(verity::schema::bytes_view_t{garbage}).code,
      code_of(transaction_error_code::invalid_transaction));

  auto wrong_version =
      verity::testing::make_transaction(1, admin, make_identity("admin"));
  wrong_version.version = 2;
  EXPECT_EQ(check(engine, wrong_version).code,
            code_of(transaction_error_code::unsupported_transaction_version));

  auto wrong_chain =
      verity::testing::make_transaction(1, admin, make_identity("admin"));
  wrong_chain.chain_id = verity::testing::make_hash(77);
  EXPECT_EQ(check(engine, wrong_chain).code,
            code_of(transaction_error_code::invalid_chain_id));

  auto skipped_nonce =
      verity::testing::make_transaction(2, admin, make_identity("admin"));
  auto rejected = check(engine, skipped_nonce);
  EXPECT_EQ(rejected.code, code_of(transaction_error_code::invalid_nonce));
  EXPECT_NE(rejected.info.find("expected nonce 1"), std::string::npos);

  auto valid =
      verity::testing::make_transaction(1, admin, make_identity("admin"));
  EXPECT_EQ(check(engine, valid).code, 0u);
}

TEST(engine_envelope, check_transaction_does_not_mutate_state) {
  auto fixture = execution_fixture{"verity_envelope_check_readonly"};
  auto admin = make_named_principal(1);
  ASSERT_EQ(fixture.init(admin).code, 0u);
  auto& engine = fixture.engine();
  auto before = engine.export_backup();

  auto tx = verity::testing::make_transaction(1, admin, make_identity("admin"));
  ASSERT_EQ(check(engine, tx).code, 0u);
  ASSERT_EQ(check(engine, tx).code, 0u);

  EXPECT_EQ(engine.export_backup(), before);
  EXPECT_FALSE(
      (verity::testing::query_keyed<
           std::optional<verity::schema::identity_record_t>>(
           engine, "/identity", admin))
          .has_value());
  EXPECT_EQ(fixture.submit(admin, make_identity("admin")).code, 0u);
}

TEST(engine_envelope, nonces_advance_per_signer_on_success_only) {
  auto fixture = execution_fixture{"verity_envelope_nonce"};
  auto admin = make_named_principal(1);
  auto alice = make_named_principal(3);
  ASSERT_EQ(fixture.init(admin).code, 0u);

  ASSERT_EQ(fixture.submit(alice, make_identity("alice")).code, 0u);
  auto duplicate = fixture.submit(alice, make_identity("alice"));
  ASSERT_EQ(duplicate.code, code_of(transaction_error_code::already_exists));

  // The failed duplicate left alice's nonce at 1.
  auto replayed =
      verity::testing::make_transaction(2, alice, make_identity("again"));
  EXPECT_EQ(check(fixture.engine(), replayed).code, 0u);
  auto stale =
      verity::testing::make_transaction(1, alice, make_identity("again"));
  EXPECT_EQ(check(fixture.engine(), stale).code,
            code_of(transaction_error_code::invalid_nonce));

  // Nonces are tracked per signer.
  auto admin_first =
      verity::testing::make_transaction(1, admin, make_identity("admin"));
  EXPECT_EQ(check(fixture.engine(), admin_first).code, 0u);
}

TEST(engine_envelope, strict_crypto_rejects_named_and_mismatched_signers) {
  auto fixture = execution_fixture{"verity_envelope_strict_types", true, true};
  auto admin = make_named_principal(1);
  ASSERT_EQ(fixture.init(admin).code, 0u);

  auto named =
      verity::testing::make_transaction(1, admin, make_identity("admin"));
  EXPECT_EQ(check(fixture.engine(), named).code,
            code_of(transaction_error_code::signature_verification_failed));

  auto ed25519 = verity::testing::make_ed25519_principal(9);
  auto mismatched =
      verity::testing::make_transaction(1, ed25519, make_identity("ed"));
  mismatched.signature = verity::schema::secp256k1_signature_t{};
  EXPECT_EQ(check(fixture.engine(), mismatched).code,
            code_of(transaction_error_code::invalid_signature_type));

  // The installed verifier accepts anything with a matching type.
  auto typed = verity::testing::make_transaction(1, ed25519, make_identity("ed"));
  EXPECT_EQ(check(fixture.engine(), typed).code, 0u);
}

TEST(engine_envelope, strict_crypto_verifies_real_ed25519_signatures) {
  if (!verity::crypto::available()) {
    GTEST_SKIP() << "OpenSSL build lacks ed25519";
  }
  auto fixture =
      execution_fixture{"verity_envelope_strict_signed", true, false};
  auto admin_seed = make_seed(11);
  auto admin_key = verity::crypto::ed25519_public_key(admin_seed);
  ASSERT_TRUE(admin_key.has_value());
  auto admin = verity::schema::principal_t{*admin_key};
  ASSERT_EQ(fixture.init(admin).code, 0u);

  auto tx = verity::testing::make_transaction(1, admin, make_identity("admin"));
  ASSERT_TRUE(sign(tx, admin_seed));
  EXPECT_EQ(check(fixture.engine(), tx).code, 0u);

  auto tampered = tx;
  tampered.payload = make_identity("mallory");
  EXPECT_EQ(check(fixture.engine(), tampered).code,
            code_of(transaction_error_code::signature_verification_failed));

  auto unsigned_tx =
      verity::testing::make_transaction(1, admin, make_identity("admin"));
  EXPECT_EQ(check(fixture.engine(), unsigned_tx).code,
            code_of(transaction_error_code::signature_verification_failed));

  auto result = verity::testing::finalize_single(
      fixture.engine(), 1, 1'010, tx);
  ASSERT_EQ(result.code, 0u) << result.log;
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events.front().type, "identity_created");

  // A signature from another key over the same message does not verify.
  auto forged =
      verity::testing::make_transaction(2, admin, make_identity("forged"));
  auto other = forged;
  ASSERT_TRUE(sign(other, make_seed(12)));
  forged.signature = other.signature;
  EXPECT_EQ(check(fixture.engine(), forged).code,
            code_of(transaction_error_code::signature_verification_failed));
}

TEST(engine_envelope, empty_verifier_callback_is_ignored) {
  auto fixture = execution_fixture{"verity_envelope_empty_verifier", true, true};
  fixture.engine().set_signature_verifier({});
  auto signer = verity::testing::make_ed25519_principal(4);
  ASSERT_EQ(fixture.init(signer).code, 0u);

  auto tx = verity::testing::make_transaction(1, signer, make_identity("x"));
  EXPECT_EQ(check(fixture.engine(), tx).code, 0u);
}
