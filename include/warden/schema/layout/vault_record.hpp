#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/vault_state.hpp>

#include <cstddef>
#include <optional>

// Fixed little-endian persisted form of a vault. Field order and widths are
// part of the on-disk format and must not change for layout tag 1.
namespace warden::schema::layout {

inline constexpr std::size_t kVaultRecordSize = 172;

warden::schema::bytes_t encode_vault_record(
    const warden::schema::vault_state_t& vault);

/// Rejects a wrong size, an unknown status tag or an unknown layout tag.
std::optional<warden::schema::vault_state_t> decode_vault_record(
    const warden::schema::bytes_view_t& bytes);

}  // namespace warden::schema::layout
