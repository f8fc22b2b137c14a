#include <gtest/gtest.h>
#include <verity/testing/registry_fixture.hpp>

#include <variant>

using verity::schema::credential_id_t;
using verity::schema::kGeneralVerification;
using verity::schema::transaction_error_code;
using verity::testing::make_ed25519_principal;

namespace {

class verification_engine_test : public ::testing::Test {
 protected:
  void SetUp() override {
    fixture_.initialize(admin_, 0);
    auto state = fixture_.context(10);
    auto registry = verity::registry::components{state};
    ASSERT_FALSE(registry.identities.create_identity(alice_, "Alice", "a@x"));
    ASSERT_FALSE(registry.identities.create_identity(bob_, "Bob", "b@x"));
    auto issued =
        registry.credentials.issue(admin_, alice_, "passport", "P1", 100);
    ASSERT_TRUE(std::holds_alternative<credential_id_t>(issued));
    state.commit();
  }

  verity::testing::registry_fixture fixture_{"verity_verification"};
  verity::schema::principal_t admin_{make_ed25519_principal(1)};
  verity::schema::principal_t alice_{make_ed25519_principal(2)};
  verity::schema::principal_t bob_{make_ed25519_principal(3)};
};

}  // namespace

TEST_F(verification_engine_test, general_verification_marks_identity) {
  auto state = fixture_.context(20);
  auto registry = verity::registry::components{state};
  EXPECT_FALSE(
      registry.verification.verify(admin_, bob_, kGeneralVerification));

  auto record = registry.identities.get_identity(bob_);
  ASSERT_TRUE(record.has_value());
  EXPECT_TRUE(record->is_verified);
  ASSERT_EQ(record->verifiers.size(), 1u);
  EXPECT_EQ(record->verifiers[0], admin_);
  ASSERT_EQ(state.events().size(), 1u);
  EXPECT_EQ(state.events()[0].type, "identity_verified");
}

TEST_F(verification_engine_test, rejects_unauthorized_and_unknown_subjects) {
  auto state = fixture_.context(20);
  auto registry = verity::registry::components{state};

  auto unauthorized =
      registry.verification.verify(bob_, alice_, kGeneralVerification);
  ASSERT_TRUE(unauthorized.has_value());
  EXPECT_EQ(unauthorized->code, transaction_error_code::unauthorized);

  auto unknown = registry.verification.verify(
      admin_, make_ed25519_principal(40), kGeneralVerification);
  ASSERT_TRUE(unknown.has_value());
  EXPECT_EQ(unknown->code, transaction_error_code::not_found);
  EXPECT_TRUE(state.events().empty());
}

TEST_F(verification_engine_test, credential_mode_checks_without_mutating) {
  auto state = fixture_.context(50);
  auto registry = verity::registry::components{state};

  EXPECT_FALSE(registry.verification.verify(admin_, alice_, 1));
  EXPECT_FALSE(registry.identities.get_identity(alice_)->is_verified);
  EXPECT_TRUE(state.pending_writes().empty());
  EXPECT_TRUE(state.events().empty());

  auto missing = registry.verification.verify(admin_, alice_, 7);
  ASSERT_TRUE(missing.has_value());
  EXPECT_EQ(missing->code, transaction_error_code::not_found);

  auto mismatch = registry.verification.verify(admin_, bob_, 1);
  ASSERT_TRUE(mismatch.has_value());
  EXPECT_EQ(mismatch->code,
            transaction_error_code::credential_subject_mismatch);
}

TEST_F(verification_engine_test, credential_mode_reports_expiry_and_revocation) {
  {
    auto state = fixture_.context(111);
    auto registry = verity::registry::components{state};
    auto expired = registry.verification.verify(admin_, alice_, 1);
    ASSERT_TRUE(expired.has_value());
    EXPECT_EQ(expired->code, transaction_error_code::credential_expired);
  }

  auto state = fixture_.context(60);
  auto registry = verity::registry::components{state};
  ASSERT_FALSE(registry.credentials.revoke(admin_, 1));
  auto revoked = registry.verification.verify(admin_, alice_, 1);
  ASSERT_TRUE(revoked.has_value());
  EXPECT_EQ(revoked->code, transaction_error_code::credential_invalid);
}
