#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/execution/capability.hpp>
#include <warden/execution/engine.hpp>
#include <warden/execution/ledger.hpp>
#include <warden/execution/vault_machine.hpp>
#include <warden/execution/whitelist.hpp>
#include <warden/schema/event_record.hpp>
#include <warden/schema/key/builder.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/schema/layout/vault_record.hpp>
#include <warden/schema/query_error_code.hpp>
#include <warden/schema/vault_event.hpp>
#include <warden/common/critical.hpp>
#include <exception>
#include <iterator>
#include <limits>
#include <span>
#include <string>
#include <tuple>
#include <variant>

using namespace warden::schema;

namespace {

using encoder_t =
    warden::schema::encoding::encoder<warden::schema::encoding::scale_encoder_tag>;

/// Outcome of dispatching one payload to the vault state machine.
struct operation_outcome final {
  vault_address_t address{};
  warden::execution::vault_machine::result_t result{
      transaction_error_code::invalid_transaction};
};

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  try {
    auto encoder = encoder_t{};
    auto tx = encoder.try_decode<transaction_t>(raw_tx);
    if (!tx) {
      error = "malformed SCALE transaction";
    }
    return tx;
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       const std::string_view codespace,
                                       std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                const std::string_view log,
                                const bytes_view_t& key,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{warden::execution::kQueryCodespace};
  return result;
}

}  // namespace

namespace warden::execution {

bytes_t make_signing_bytes(const transaction_t& tx) {
  auto encoder = encoder_t{};
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

engine::engine(
    encoding::encoder<encoding::scale_encoder_tag>& encoder,
    warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage,
    const hash32_t& chain_id,
    const bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      chain_id_{chain_id},
      require_strict_crypto_{require_strict_crypto} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_) {
    if (!warden::crypto::available()) {
      warden::common::critical("OpenSSL does not provide ed25519");
    }
    signature_verifier_ = warden::crypto::verify_signature;
  }
  load_persisted_state();
  spdlog::info("Execution engine ready at height {} (chain {}, strict crypto {})",
               last_committed_height_,
               to_hex(bytes_view_t{chain_id_.data(), chain_id_.size()}),
               require_strict_crypto_);
}

void engine::load_persisted_state() {
  auto committed = storage_.load_committed_state();
  if (!committed) {
    last_committed_height_ = 0;
    last_committed_state_root_ = make_zero_hash();
    has_committed_state_ = false;
    return;
  }
  last_committed_height_ = committed->height;
  last_committed_state_root_ = committed->state_root;
  has_committed_state_ = true;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_) {
    spdlog::warn("Ignoring signature verifier override in strict crypto mode");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

std::optional<bytes_t> engine::read(const overlay_t& overlay,
                                    const bytes_t& key) const {
  auto it = overlay.find(key);
  if (it != std::end(overlay)) {
    return it->second;
  }
  return storage_.get_raw(bytes_view_t{key.data(), key.size()});
}

uint64_t engine::read_u64(const overlay_t& overlay, const bytes_t& key) const {
  auto raw = read(overlay, key);
  if (!raw) {
    return 0;
  }
  return encoder_.decode<uint64_t>(bytes_view_t{raw->data(), raw->size()});
}

void engine::write_u64(overlay_t& overlay,
                       const bytes_t& key,
                       const uint64_t value) {
  overlay[key] = encoder_.encode(value);
}

std::optional<transaction_error_code> engine::validate_transaction(
    const transaction_t& tx,
    const overlay_t& overlay) const {
  if (tx.version != 1) {
    return transaction_error_code::unsupported_transaction_version;
  }
  if (tx.chain_id != chain_id_) {
    return transaction_error_code::invalid_chain_id;
  }
  auto expected_nonce =
      read_u64(overlay, warden::schema::key::make_nonce_key(tx.signer)) + 1;
  if (tx.nonce != expected_nonce) {
    return transaction_error_code::invalid_nonce;
  }
  if (signature_verifier_) {
    auto message = make_signing_bytes(tx);
    if (!signature_verifier_(bytes_view_t{message.data(), message.size()},
                             tx.signer, tx.signature)) {
      return transaction_error_code::signature_verification_failed;
    }
  }
  return std::nullopt;
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto tx = decode_transaction(raw_tx, decode_error);
  if (!tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             kCheckTxCodespace, decode_error);
  }
  if (auto error = validate_transaction(*tx, overlay_t{})) {
    spdlog::debug("CheckTx rejected transaction: {}", to_string(*error));
    return make_error_result(*error, kCheckTxCodespace);
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_transaction(
    const transaction_t& tx,
    overlay_t& overlay,
    const int64_t height,
    const uint32_t tx_index,
    const timestamp_seconds_t block_time) {
  if (auto error = validate_transaction(tx, overlay)) {
    return make_error_result(*error, kFinalizeCodespace);
  }

  auto load_vault = [&](const vault_address_t& address)
      -> std::variant<vault_state_t, transaction_error_code> {
    auto raw = read(overlay, warden::schema::key::make_vault_key(address));
    if (!raw) {
      return transaction_error_code::vault_missing;
    }
    auto vault = warden::schema::layout::decode_vault_record(
        bytes_view_t{raw->data(), raw->size()});
    if (!vault) {
      spdlog::error("Vault record at {} failed to decode",
                    to_hex(bytes_view_t{address.data(), address.size()}));
      return transaction_error_code::corrupt_vault_record;
    }
    return *vault;
  };

  // Load the addressed vault and hand it to `operation`, which runs the state
  // machine with the already resolved capability.
  auto with_vault = [&](const identity_t& owner, const session_id_t& session_id,
                        auto&& operation) -> operation_outcome {
    auto outcome = operation_outcome{};
    outcome.address = warden::schema::key::make_vault_address(owner, session_id);
    auto loaded = load_vault(outcome.address);
    if (auto* error = std::get_if<transaction_error_code>(&loaded)) {
      outcome.result = *error;
      return outcome;
    }
    outcome.result =
        operation(std::get<vault_state_t>(loaded), outcome.address);
    return outcome;
  };

  namespace machine = vault_machine;
  auto capability = resolve_capability(tx.payload, tx.signer);
  auto outcome = std::visit(
      overloaded{
          [&](const initialize_session_t& op,
              const owner_capability& caller) -> operation_outcome {
            auto outcome = operation_outcome{};
            outcome.address = warden::schema::key::make_vault_address(
                caller.signer, op.session_id);
            if (read(overlay,
                     warden::schema::key::make_vault_key(outcome.address))) {
              outcome.result = transaction_error_code::vault_exists;
              return outcome;
            }
            outcome.result = machine::initialize(caller, op, block_time);
            return outcome;
          },
          [&](const deposit_t& op, const owner_capability& caller) {
            return with_vault(op.owner, op.session_id,
                              [&](const vault_state_t& vault,
                                  const vault_address_t& custody) {
                                return machine::deposit(vault, custody, caller,
                                                        op, block_time);
                              });
          },
          [&](const execute_swap_t& op, const agent_capability& caller) {
            return with_vault(op.owner, op.session_id,
                              [&](const vault_state_t& vault,
                                  const vault_address_t&) {
                                return machine::execute_swap(vault, caller, op,
                                                             block_time);
                              });
          },
          [&](const deduct_compute_fee_t& op, const crank_capability& caller) {
            return with_vault(op.owner, op.session_id,
                              [&](const vault_state_t& vault,
                                  const vault_address_t& custody) {
                                return machine::deduct_compute_fee(
                                    vault, custody, caller, op, block_time);
                              });
          },
          [&](const pause_session_t& op, const owner_capability& caller) {
            return with_vault(
                op.owner, op.session_id,
                [&](const vault_state_t& vault, const vault_address_t&) {
                  return machine::pause(vault, caller);
                });
          },
          [&](const resume_session_t& op, const owner_capability& caller) {
            return with_vault(
                op.owner, op.session_id,
                [&](const vault_state_t& vault, const vault_address_t&) {
                  return machine::resume(vault, caller, block_time);
                });
          },
          [&](const withdraw_t& op, const owner_capability& caller) {
            return with_vault(
                op.owner, op.session_id,
                [&](const vault_state_t& vault,
                    const vault_address_t& custody) {
                  return machine::withdraw(vault, custody, caller);
                });
          },
          [&](const expire_session_t& op, const crank_capability& caller) {
            return with_vault(
                op.owner, op.session_id,
                [&](const vault_state_t& vault, const vault_address_t&) {
                  return machine::expire(vault, caller, block_time);
                });
          },
          [](const auto&, const auto&) -> operation_outcome {
            return operation_outcome{};
          }},
      tx.payload, capability);

  if (auto* error = std::get_if<transaction_error_code>(&outcome.result)) {
    spdlog::debug("Transaction {} at height {} rejected: {}", tx_index, height,
                  to_string(*error));
    return make_error_result(*error, is_escrow_error(*error)
                                         ? kEscrowCodespace
                                         : kFinalizeCodespace);
  }
  auto& transition = std::get<machine::transition>(outcome.result);

  // Stage value movement before any record is written; a transfer that
  // cannot be covered aborts the whole operation.
  auto balances = ledger{[&](const account_id_t& account) {
    return read_u64(overlay, warden::schema::key::make_account_key(account));
  }};
  if (auto error = balances.stage(transition.transfers)) {
    spdlog::debug("Transaction {} at height {} rejected by ledger: {}",
                  tx_index, height, to_string(*error));
    return make_error_result(*error, kFinalizeCodespace);
  }

  auto writes = overlay_t{};
  writes[warden::schema::key::make_vault_key(outcome.address)] =
      warden::schema::layout::encode_vault_record(transition.vault);
  for (const auto& [account, balance] : balances.staged()) {
    write_u64(writes, warden::schema::key::make_account_key(account), balance);
  }
  write_u64(writes, warden::schema::key::make_nonce_key(tx.signer), tx.nonce);

  auto event = make_transaction_event(transition.event);
  auto seq_key = make_bytes(warden::schema::key::kEventSeqKey);
  auto event_id = read_u64(overlay, seq_key) + 1;
  auto record = event_record_t{};
  record.event_id = event_id;
  record.height = static_cast<uint64_t>(height);
  record.tx_index = tx_index;
  record.event = event;
  writes[warden::schema::key::make_event_key(event_id)] =
      encoder_.encode(record);
  write_u64(writes, seq_key, event_id);

  for (auto& [key, value] : writes) {
    overlay[key] = std::move(value);
  }

  auto result = transaction_result_t{};
  result.log = std::string{event.type};
  result.data = bytes_t{std::begin(outcome.address), std::end(outcome.address)};
  result.events.push_back(std::move(event));
  return result;
}

block_result_t engine::finalize_block(const int64_t height,
                                      const timestamp_seconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  if (height != last_committed_height_ + 1) {
    spdlog::warn("Finalizing height {} after committed height {}", height,
                 last_committed_height_);
  }

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  auto overlay = overlay_t{};
  for (size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto tx = decode_transaction(bytes_view_t{txs[i].data(), txs[i].size()},
                                 decode_error);
    if (!tx) {
      result.tx_results.push_back(
          make_error_result(transaction_error_code::invalid_transaction,
                            kFinalizeCodespace, decode_error));
      continue;
    }
    result.tx_results.push_back(execute_transaction(
        *tx, overlay, height, static_cast<uint32_t>(i), block_time));
  }

  result.state_root =
      fold_state_root(last_committed_state_root_, height, overlay);
  pending_ = pending_block{
      .height = height, .state_root = result.state_root, .writes = overlay};
  spdlog::info("Finalized height {} with {} transaction(s), {} write(s)",
               height, txs.size(), overlay.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (!pending_) {
    spdlog::warn("Commit requested without a finalized block");
    return commit_result_t{.committed_height = last_committed_height_,
                           .state_root = last_committed_state_root_};
  }

  auto entries = std::vector<warden::storage::key_value_entry_t>{};
  entries.reserve(pending_->writes.size());
  for (const auto& [key, value] : pending_->writes) {
    entries.emplace_back(key, value);
  }
  storage_.commit(entries,
                  warden::storage::committed_state{
                      .height = pending_->height,
                      .state_root = pending_->state_root});

  last_committed_height_ = pending_->height;
  last_committed_state_root_ = pending_->state_root;
  has_committed_state_ = true;
  pending_.reset();
  spdlog::info("Committed height {}", last_committed_height_);
  return commit_result_t{.committed_height = last_committed_height_,
                         .state_root = last_committed_state_root_};
}

bool engine::apply_genesis(const std::vector<genesis_account_t>& accounts) {
  auto lock = std::scoped_lock{mutex_};
  if (has_committed_state_ || pending_) {
    spdlog::info("Skipping genesis accounts; state already initialized");
    return false;
  }

  auto balances = ledger{[&](const account_id_t& account) {
    return read_u64(overlay_t{}, warden::schema::key::make_account_key(account));
  }};
  for (const auto& [account, amount] : accounts) {
    if (auto error = balances.credit(account, amount)) {
      spdlog::error("Genesis credit for {} failed: {}",
                    identity_to_string(account), to_string(*error));
      return false;
    }
  }

  auto writes = overlay_t{};
  for (const auto& [account, balance] : balances.staged()) {
    write_u64(writes, warden::schema::key::make_account_key(account), balance);
  }
  auto state_root = fold_state_root(make_zero_hash(), 0, writes);
  auto entries = std::vector<warden::storage::key_value_entry_t>(
      std::begin(writes), std::end(writes));
  storage_.commit(entries, warden::storage::committed_state{
                               .height = 0, .state_root = state_root});

  last_committed_height_ = 0;
  last_committed_state_root_ = state_root;
  has_committed_state_ = true;
  spdlog::info("Applied {} genesis account(s)", accounts.size());
  return true;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto info = app_info_t{};
  info.last_block_height = last_committed_height_;
  info.last_block_state_root = last_committed_state_root_;
  info.chain_id = chain_id_;
  return info;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
    return result;
  }

  if (path == "/engine/whitelist") {
    const auto& venues = venue_whitelist();
    result.value = encoder_.encode(
        std::vector<hash32_t>(std::begin(venues), std::end(venues)));
    return result;
  }

  if (path == "/state/vault") {
    auto key = encoder_.try_decode<std::tuple<identity_t, session_id_t>>(data);
    if (!key) {
      return make_query_error(query_error_code::invalid_key,
                              "expected (owner, session_id)", data,
                              last_committed_height_);
    }
    auto address = warden::schema::key::make_vault_address(std::get<0>(*key),
                                                           std::get<1>(*key));
    auto vault_key = warden::schema::key::make_vault_key(address);
    auto raw = storage_.get_raw(bytes_view_t{vault_key.data(), vault_key.size()});
    if (!raw) {
      return make_query_error(query_error_code::not_found, "vault not found",
                              data, last_committed_height_);
    }
    result.value = std::move(*raw);
    return result;
  }

  if (path == "/state/account" || path == "/state/nonce") {
    auto id = encoder_.try_decode<hash32_t>(data);
    if (!id) {
      return make_query_error(query_error_code::invalid_key,
                              "expected 32-byte identity", data,
                              last_committed_height_);
    }
    auto key = path == "/state/account"
                   ? warden::schema::key::make_account_key(*id)
                   : warden::schema::key::make_nonce_key(*id);
    result.value = encoder_.encode(read_u64(overlay_t{}, key));
    return result;
  }

  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range || std::get<0>(*range) > std::get<1>(*range) ||
        std::get<1>(*range) - std::get<0>(*range) >= kMaxEventRange) {
      return make_query_error(query_error_code::invalid_key,
                              "expected (from_id, to_id) within range limit",
                              data, last_committed_height_);
    }
    auto records = std::vector<event_record_t>{};
    for (auto id = std::get<0>(*range); id <= std::get<1>(*range); ++id) {
      auto event_key = warden::schema::key::make_event_key(id);
      auto record = storage_.get<event_record_t>(
          encoder_, bytes_view_t{event_key.data(), event_key.size()});
      if (record) {
        records.push_back(std::move(*record));
      }
      if (id == std::numeric_limits<uint64_t>::max()) {
        break;
      }
    }
    result.value = encoder_.encode(records);
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data,
                          last_committed_height_);
}

hash32_t engine::fold_state_root(const hash32_t& previous,
                                 const int64_t height,
                                 const overlay_t& writes) const {
  auto material = warden::schema::key::builder{};
  material.write(std::span<const uint8_t>{previous.data(), previous.size()});
  material.write(height);
  for (const auto& [key, value] : writes) {
    material.write(static_cast<uint32_t>(key.size()));
    material.write(std::span<const uint8_t>{key.data(), key.size()});
    material.write(static_cast<uint32_t>(value.size()));
    material.write(std::span<const uint8_t>{value.data(), value.size()});
  }
  return warden::blake3::hash(
      bytes_view_t{material.data.data(), material.data.size()});
}

}  // namespace warden::execution
