#pragma once

#include <gtest/gtest.h>

#include <warden/execution/engine.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/event_record.hpp>
#include <warden/schema/layout/vault_record.hpp>
#include <warden/schema/vault_state.hpp>
#include <warden/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

namespace warden::testing {

using scale_encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

inline warden::schema::transaction_t make_transaction(
    const warden::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const warden::schema::identity_t& signer,
    const warden::schema::transaction_payload_t& payload) {
  return warden::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = warden::schema::ed25519_signature_t{}};
}

inline warden::schema::bytes_t encode_transaction(
    const warden::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

/// Finalize and commit a block holding a single transaction.
inline warden::schema::transaction_result_t finalize_single(
    warden::execution::engine& engine,
    const int64_t height,
    const warden::schema::timestamp_seconds_t block_time,
    const warden::schema::transaction_t& tx) {
  auto block = engine.finalize_block(height, block_time,
                                     {encode_transaction(tx)});
  EXPECT_EQ(block.tx_results.size(), 1u);
  auto committed = engine.commit();
  EXPECT_EQ(committed.committed_height, height);
  EXPECT_EQ(committed.state_root, block.state_root);
  if (block.tx_results.empty()) {
    return {};
  }
  return block.tx_results.front();
}

inline uint64_t query_u64(warden::execution::engine& engine,
                          const std::string_view path,
                          const warden::schema::hash32_t& id) {
  auto encoder = scale_encoder_t{};
  auto key = encoder.encode(id);
  auto result =
      engine.query(path, warden::schema::bytes_view_t{key.data(), key.size()});
  EXPECT_EQ(result.code, 0u) << result.log;
  return encoder.decode<uint64_t>(
      warden::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline uint64_t query_balance(warden::execution::engine& engine,
                              const warden::schema::account_id_t& account) {
  return query_u64(engine, "/state/account", account);
}

inline uint64_t query_nonce(warden::execution::engine& engine,
                            const warden::schema::identity_t& signer) {
  return query_u64(engine, "/state/nonce", signer);
}

inline std::optional<warden::schema::vault_state_t> query_vault(
    warden::execution::engine& engine,
    const warden::schema::identity_t& owner,
    const warden::schema::session_id_t& session_id) {
  auto encoder = scale_encoder_t{};
  auto key = encoder.encode(std::tuple{owner, session_id});
  auto result =
      engine.query("/state/vault", warden::schema::bytes_view_t{key.data(), key.size()});
  if (result.code != 0) {
    return std::nullopt;
  }
  return warden::schema::layout::decode_vault_record(
      warden::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline std::vector<warden::schema::event_record_t> query_events(
    warden::execution::engine& engine,
    const uint64_t from_id,
    const uint64_t to_id) {
  auto encoder = scale_encoder_t{};
  auto key = encoder.encode(std::tuple{from_id, to_id});
  auto result = engine.query(
      "/events/range", warden::schema::bytes_view_t{key.data(), key.size()});
  EXPECT_EQ(result.code, 0u) << result.log;
  return encoder.decode<std::vector<warden::schema::event_record_t>>(
      warden::schema::bytes_view_t{result.value.data(), result.value.size()});
}

}  // namespace warden::testing
