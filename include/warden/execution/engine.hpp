#pragma once

#include <warden/execution/signature_verifier.hpp>
#include <warden/schema/app_info.hpp>
#include <warden/schema/block_result.hpp>
#include <warden/schema/commit_result.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/query_result.hpp>
#include <warden/schema/transaction.hpp>
#include <warden/schema/transaction_error_code.hpp>
#include <warden/schema/transaction_result.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::execution {

inline constexpr auto kCheckTxCodespace = std::string_view{"warden.checktx"};
inline constexpr auto kFinalizeCodespace = std::string_view{"warden.finalize"};
inline constexpr auto kEscrowCodespace = std::string_view{"warden.escrow"};
inline constexpr auto kQueryCodespace = std::string_view{"warden.query"};

/// Upper bound on the number of events returned by one `/events/range` query.
inline constexpr uint64_t kMaxEventRange = 1000;

using genesis_account_t =
    std::pair<warden::schema::account_id_t, warden::schema::amount_t>;

/// SCALE encoding of (version, chain_id, nonce, signer, payload): the message
/// covered by a transaction signature.
warden::schema::bytes_t make_signing_bytes(
    const warden::schema::transaction_t& tx);

/// Escrow host environment used by the node RPC server.
///
/// The engine decodes signed transactions, checks the envelope (version,
/// chain id, nonce, signature), loads the addressed vault, runs the vault
/// state machine and stages the resulting transfers and records. Blocks are
/// executed against an in-memory overlay and written to storage atomically on
/// commit. The engine is the single writer; every public method takes the
/// same mutex.
class engine final {
 public:
  /// `require_strict_crypto` enables ed25519 verification through OpenSSL.
  /// When false, an installed verifier decides and, without one, signatures
  /// are accepted as-is.
  explicit engine(
      warden::schema::encoding::encoder<
          warden::schema::encoding::scale_encoder_tag>& encoder,
      warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage,
      const warden::schema::hash32_t& chain_id,
      bool require_strict_crypto = true);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Decodes and validates the envelope against committed state. Does not
  /// execute the operation and never mutates state.
  warden::schema::transaction_result_t check_transaction(
      const warden::schema::bytes_view_t& raw_tx);

  /// Execute a block at `block_time` and compute its resulting state_root.
  ///
  /// Transactions are applied in order; a failed transaction contributes no
  /// writes. Results are returned for every transaction.
  warden::schema::block_result_t finalize_block(
      int64_t height,
      warden::schema::timestamp_seconds_t block_time,
      const std::vector<warden::schema::bytes_t>& txs);

  /// Persist the last finalized block in one write batch.
  warden::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  warden::schema::app_info_t info() const;

  /// Execute a read-path query against committed state.
  warden::schema::query_result_t query(
      std::string_view path,
      const warden::schema::bytes_view_t& data);

  /// Fund accounts on a fresh database. Returns false, without writing, once
  /// any state has been committed.
  bool apply_genesis(const std::vector<genesis_account_t>& accounts);

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is enabled.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  using overlay_t = std::map<warden::schema::bytes_t, warden::schema::bytes_t>;

  struct pending_block final {
    int64_t height{};
    warden::schema::hash32_t state_root{};
    overlay_t writes;
  };

  /// Validate version, chain id, nonce and signature of a decoded envelope.
  std::optional<warden::schema::transaction_error_code> validate_transaction(
      const warden::schema::transaction_t& tx,
      const overlay_t& overlay) const;

  /// Run one decoded transaction and merge its writes into `overlay` on
  /// success.
  warden::schema::transaction_result_t execute_transaction(
      const warden::schema::transaction_t& tx,
      overlay_t& overlay,
      int64_t height,
      uint32_t tx_index,
      warden::schema::timestamp_seconds_t block_time);

  std::optional<warden::schema::bytes_t> read(
      const overlay_t& overlay,
      const warden::schema::bytes_t& key) const;
  uint64_t read_u64(const overlay_t& overlay,
                    const warden::schema::bytes_t& key) const;
  void write_u64(overlay_t& overlay,
                 const warden::schema::bytes_t& key,
                 uint64_t value);

  warden::schema::hash32_t fold_state_root(
      const warden::schema::hash32_t& previous,
      int64_t height,
      const overlay_t& writes) const;

  void load_persisted_state();

  mutable std::mutex mutex_;
  warden::schema::encoding::encoder<
      warden::schema::encoding::scale_encoder_tag>& encoder_;
  warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage_;
  warden::schema::hash32_t chain_id_;
  int64_t last_committed_height_{};
  warden::schema::hash32_t last_committed_state_root_{};
  bool has_committed_state_{false};
  std::optional<pending_block> pending_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace warden::execution
