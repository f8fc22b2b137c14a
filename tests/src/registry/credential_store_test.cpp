#include <gtest/gtest.h>
#include <verity/testing/registry_fixture.hpp>

#include <limits>
#include <variant>

using verity::schema::credential_id_t;
using verity::schema::credential_status_t;
using verity::schema::transaction_error_code;
using verity::testing::make_ed25519_principal;

namespace {

class credential_store_test : public ::testing::Test {
 protected:
  void SetUp() override {
    fixture_.initialize(admin_, 0);
    auto state = fixture_.context(10);
    auto registry = verity::registry::components{state};
    ASSERT_FALSE(
        registry.identities.create_identity(subject_, "Bob", "bob@x"));
    state.commit();
  }

  verity::testing::registry_fixture fixture_{"verity_credentials"};
  verity::schema::principal_t admin_{make_ed25519_principal(1)};
  verity::schema::principal_t subject_{make_ed25519_principal(2)};
};

transaction_error_code error_code(
    const verity::registry::operation_result_t<credential_id_t>& result) {
  return std::get<verity::registry::operation_error>(result).code;
}

}  // namespace

TEST_F(credential_store_test, issue_assigns_sequential_ids_and_expiry) {
  auto state = fixture_.context(1'000);
  auto registry = verity::registry::components{state};

  auto first = registry.credentials.issue(admin_, subject_, "passport",
                                          "P123", 3'600);
  auto second = registry.credentials.issue(admin_, subject_, "degree",
                                           "BSc", 0);
  ASSERT_TRUE(std::holds_alternative<credential_id_t>(first));
  ASSERT_TRUE(std::holds_alternative<credential_id_t>(second));
  EXPECT_EQ(std::get<credential_id_t>(first), 1u);
  EXPECT_EQ(std::get<credential_id_t>(second), 2u);
  EXPECT_EQ(registry.credentials.total(), 2u);

  auto record = registry.credentials.get(1);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->issuer, admin_);
  EXPECT_EQ(record->subject, subject_);
  EXPECT_EQ(record->credential_type, "passport");
  EXPECT_EQ(record->data, "P123");
  EXPECT_EQ(record->issued_at, 1'000u);
  EXPECT_EQ(record->expires_at, 4'600u);
  EXPECT_TRUE(record->is_valid);

  EXPECT_EQ(registry.credentials.ids_for_subject(subject_),
            (std::vector<credential_id_t>{1, 2}));
  ASSERT_EQ(state.events().size(), 2u);
  EXPECT_EQ(state.events()[0].type, "credential_issued");
}

TEST_F(credential_store_test, issue_checks_authorization_then_subject_then_input) {
  auto outsider = make_ed25519_principal(9);
  auto state = fixture_.context(1'000);
  auto registry = verity::registry::components{state};

  EXPECT_EQ(error_code(registry.credentials.issue(outsider, subject_, "", "",
                                                  0)),
            transaction_error_code::unauthorized);
  EXPECT_EQ(error_code(registry.credentials.issue(admin_, outsider, "", "", 0)),
            transaction_error_code::not_found);
  EXPECT_EQ(error_code(registry.credentials.issue(admin_, subject_, "", "x",
                                                  0)),
            transaction_error_code::invalid_input);
  EXPECT_EQ(error_code(registry.credentials.issue(admin_, subject_, "x", "",
                                                  0)),
            transaction_error_code::invalid_input);
  EXPECT_EQ(error_code(registry.credentials.issue(
                admin_, subject_, "x", "y",
                std::numeric_limits<uint64_t>::max())),
            transaction_error_code::invalid_input);
  EXPECT_EQ(registry.credentials.total(), 0u);
  EXPECT_TRUE(state.events().empty());
}

TEST_F(credential_store_test, only_the_issuer_revokes) {
  auto other_verifier = make_ed25519_principal(3);
  {
    auto state = fixture_.context(100);
    auto registry = verity::registry::components{state};
    ASSERT_FALSE(registry.roles.authorize_verifier(admin_, other_verifier));
    ASSERT_TRUE(std::holds_alternative<credential_id_t>(
        registry.credentials.issue(admin_, subject_, "passport", "P", 100)));
    state.commit();
  }

  auto state = fixture_.context(150);
  auto registry = verity::registry::components{state};
  auto by_other = registry.credentials.revoke(other_verifier, 1);
  ASSERT_TRUE(by_other.has_value());
  EXPECT_EQ(by_other->code, transaction_error_code::unauthorized);

  auto unknown = registry.credentials.revoke(admin_, 99);
  ASSERT_TRUE(unknown.has_value());
  EXPECT_EQ(unknown->code, transaction_error_code::unauthorized);

  EXPECT_FALSE(registry.credentials.revoke(admin_, 1).has_value());
  EXPECT_FALSE(registry.credentials.get(1)->is_valid);
  EXPECT_EQ(registry.credentials.status(1, 150), credential_status_t::revoked);

  // Revoking again is allowed and stays revoked.
  EXPECT_FALSE(registry.credentials.revoke(admin_, 1).has_value());
  EXPECT_FALSE(registry.credentials.get(1)->is_valid);
}

TEST_F(credential_store_test, status_is_derived_from_block_time) {
  {
    auto state = fixture_.context(100);
    auto registry = verity::registry::components{state};
    ASSERT_TRUE(std::holds_alternative<credential_id_t>(
        registry.credentials.issue(admin_, subject_, "passport", "P", 50)));
    state.commit();
  }

  auto state = fixture_.context(100);
  auto registry = verity::registry::components{state};
  EXPECT_EQ(registry.credentials.status(1, 150), credential_status_t::active);
  EXPECT_EQ(registry.credentials.status(1, 151), credential_status_t::expired);
  EXPECT_FALSE(registry.credentials.status(2, 100).has_value());

  // Stored record never changes on expiry.
  EXPECT_TRUE(registry.credentials.get(1)->is_valid);
}
