#pragma once

#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace warden::schema::key {

extern const std::string_view kVaultKeyPrefix;
extern const std::string_view kAccountKeyPrefix;
extern const std::string_view kNonceKeyPrefix;
extern const std::string_view kEventSeqKey;
extern const std::string_view kEventPrefix;

/// Deterministic vault address: blake3("vault" || session_id || owner).
///
/// The address keys the persisted vault record and names the vault's
/// custody account in the ledger.
warden::schema::vault_address_t make_vault_address(
    const warden::schema::identity_t& owner,
    const warden::schema::session_id_t& session_id);

warden::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const warden::schema::bytes_t& id);
warden::schema::bytes_t make_vault_key(
    const warden::schema::vault_address_t& address);
warden::schema::bytes_t make_account_key(
    const warden::schema::account_id_t& account);
warden::schema::bytes_t make_nonce_key(
    const warden::schema::identity_t& signer);
warden::schema::bytes_t make_event_key(uint64_t event_id);

}  // namespace warden::schema::key
