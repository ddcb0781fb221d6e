#include <warden/execution/engine.hpp>
#include <warden/schema/vault_state.hpp>
#include <gtest/gtest.h>

TEST(engine_types, defaults_are_stable) {
  auto tx = warden::schema::transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_EQ(tx.gas_wanted, 0);
  EXPECT_EQ(tx.gas_used, 0);
  EXPECT_TRUE(tx.events.empty());

  auto block = warden::schema::block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());
  EXPECT_EQ(block.state_root, warden::schema::hash32_t{});

  auto commit = warden::schema::commit_result_t{};
  EXPECT_EQ(commit.retain_height, 0);
  EXPECT_EQ(commit.committed_height, 0);

  auto info = warden::schema::app_info_t{};
  EXPECT_EQ(info.data, "warden-escrow");
  EXPECT_EQ(info.version, "0.1.0");
  EXPECT_EQ(info.last_block_height, 0);
}

TEST(engine_types, new_vault_starts_pending_and_empty) {
  auto vault = warden::schema::vault_state_t{};
  EXPECT_EQ(vault.status, warden::schema::vault_status_t::pending);
  EXPECT_EQ(vault.balance, 0u);
  EXPECT_EQ(vault.fee_collected, 0u);
  EXPECT_EQ(vault.compute_fees_paid, 0u);
  EXPECT_EQ(vault.layout_tag, warden::schema::kVaultLayoutTag);
}

TEST(engine_types, verifier_callback_type_compiles) {
  auto verifier = warden::execution::signature_verifier_t{
      [](const warden::schema::bytes_view_t&,
         const warden::schema::identity_t&,
         const warden::schema::ed25519_signature_t&) { return true; }};
  EXPECT_TRUE(static_cast<bool>(verifier));
}
