#include <verity/execution/engine.hpp>
#include <gtest/gtest.h>

TEST(engine_types, defaults_are_stable) {
  auto tx = verity::schema::transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_TRUE(tx.codespace.empty());
  EXPECT_TRUE(tx.events.empty());

  auto block = verity::schema::block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());

  auto commit = verity::schema::commit_result_t{};
  EXPECT_EQ(commit.retain_height, 0);
  EXPECT_EQ(commit.committed_height, 0);

  auto info = verity::schema::app_info_t{};
  EXPECT_EQ(info.data, "verity-registry");
  EXPECT_EQ(info.version, "0.1.0");
  EXPECT_FALSE(info.initialized);

  auto replay = verity::schema::replay_result_t{};
  EXPECT_FALSE(replay.ok);
  EXPECT_EQ(replay.tx_count, 0u);
}

TEST(engine_types, verifier_callback_type_compiles) {
  auto verifier = verity::execution::signature_verifier_t{
      [](const verity::schema::bytes_view_t&,
         const verity::schema::signer_id_t&,
         const verity::schema::signature_t&) { return true; }};
  EXPECT_TRUE(static_cast<bool>(verifier));
}
