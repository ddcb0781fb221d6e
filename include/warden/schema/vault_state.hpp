#pragma once

#include <warden/schema/fee_schedule.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/vault_status.hpp>

#include <cstdint>

// Schema type: vault state.
// Escrow workflow: one record per (owner, session_id). Holds the delegated
// trading balance and the fee bookkeeping of a session.
namespace warden::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  identity_t owner{};
  identity_t agent{};
  identity_t fee_recipient{};
  session_id_t session_id{};
  amount_t balance{};
  amount_t fee_collected{};
  amount_t compute_fees_paid{};
  uint16_t duration_days{};
  vault_status_t status{vault_status_t::pending};
  uint8_t layout_tag{kVaultLayoutTag};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t funded_at{};
  timestamp_seconds_t expires_at{};
  timestamp_seconds_t last_fee_deduction{};

  bool operator==(const vault_state<1>&) const = default;
};

using vault_state_t = vault_state<1>;

}  // namespace warden::schema
