#include <gtest/gtest.h>
#include <verity/schema/primitives.hpp>

#include <string>
#include <string_view>
#include <variant>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = verity::schema::bytes_t(32, 0xAB);
  auto hash = verity::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = verity::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_short_or_bad_hex) {
  EXPECT_FALSE(verity::schema::try_make_hash32(std::string_view{"0102"}));
  EXPECT_FALSE(verity::schema::try_make_hash32(
      std::string_view{"zz02030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"}));
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = verity::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_encodes_lowercase_and_decodes_either_case) {
  auto bytes = verity::schema::bytes_t{0x00, 0xAB, 0xFF};
  EXPECT_EQ(verity::schema::to_hex(bytes), "00abff");
  EXPECT_EQ(verity::schema::from_hex("00ABff"), bytes);
  EXPECT_FALSE(verity::schema::try_from_hex("abc").has_value());
}

TEST(primitives, base64_matches_known_vectors) {
  EXPECT_EQ(verity::schema::to_base64(verity::schema::make_bytes(
                std::string_view{"verity"})),
            "dmVyaXR5");
  EXPECT_EQ(verity::schema::to_base64(
                verity::schema::make_bytes(std::string_view{"ab"})),
            "YWI=");
  EXPECT_EQ(verity::schema::make_string(verity::schema::from_base64("YQ==")),
            "a");
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  auto decoded = verity::schema::try_from_base64("not base64***");
  EXPECT_FALSE(decoded.has_value());
  EXPECT_FALSE(verity::schema::try_from_base64("YQ==YQ==").has_value());
}

TEST(primitives, signer_ids_parse_by_kind) {
  auto key = std::string(64, 'a');
  auto ed = verity::schema::try_make_signer_id("ed25519", key);
  ASSERT_TRUE(ed.has_value());
  EXPECT_TRUE(std::holds_alternative<verity::schema::ed25519_signer_id>(*ed));

  auto named = verity::schema::try_make_signer_id("named", key);
  ASSERT_TRUE(named.has_value());
  EXPECT_TRUE(std::holds_alternative<verity::schema::named_signer_t>(*named));
  EXPECT_NE(*ed, *named);

  auto secp = verity::schema::try_make_signer_id("secp256k1",
                                                 "02" + std::string(64, 'b'));
  ASSERT_TRUE(secp.has_value());
  EXPECT_TRUE(
      std::holds_alternative<verity::schema::secp256k1_signer_id>(*secp));

  EXPECT_FALSE(verity::schema::try_make_signer_id("secp256k1", key));
  EXPECT_FALSE(verity::schema::try_make_signer_id("rsa", key));
}

TEST(primitives, signer_to_string_prefixes_kind) {
  auto signer = *verity::schema::try_make_signer_id(
      "ed25519", "0x" + std::string(62, '0') + "01");
  EXPECT_EQ(verity::schema::to_string(signer),
            "ed25519:" + std::string(62, '0') + "01");
}
