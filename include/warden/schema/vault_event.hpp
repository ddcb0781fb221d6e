#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_event.hpp>
#include <cstdint>
#include <string_view>
#include <variant>

// Typed escrow events, one per successful vault transition.
namespace warden::schema {

struct session_created_t final {
  session_id_t session_id{};
  identity_t owner{};
  identity_t agent{};
  uint16_t duration_days{};
};

struct deposited_t final {
  session_id_t session_id{};
  amount_t amount{};
  amount_t fee{};
  amount_t trading_balance{};
  timestamp_seconds_t expires_at{};
};

struct swap_executed_t final {
  session_id_t session_id{};
  identity_t agent{};
  identity_t venue{};
  amount_t amount_in{};
  amount_t minimum_amount_out{};
  timestamp_seconds_t timestamp{};
};

struct compute_fee_deducted_t final {
  session_id_t session_id{};
  amount_t fee{};
  amount_t remaining_balance{};
};

struct session_paused_t final {
  session_id_t session_id{};
};

struct session_resumed_t final {
  session_id_t session_id{};
};

struct withdrawn_t final {
  session_id_t session_id{};
  amount_t amount{};
  identity_t owner{};
};

struct session_expired_t final {
  session_id_t session_id{};
  amount_t remaining_balance{};
};

using vault_event_t = std::variant<session_created_t,
                                   deposited_t,
                                   swap_executed_t,
                                   compute_fee_deducted_t,
                                   session_paused_t,
                                   session_resumed_t,
                                   withdrawn_t,
                                   session_expired_t>;

/// Event type string, e.g. "warden.deposited".
std::string_view event_type(const vault_event_t& event);

/// Render a typed event as key/value attributes. Amounts and times are
/// decimal, identities base58 and session ids hex; `session_id` is indexed.
transaction_event_t make_transaction_event(const vault_event_t& event);

}  // namespace warden::schema
