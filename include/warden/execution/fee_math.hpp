#pragma once

#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <optional>

// Checked escrow arithmetic. Every function returns std::nullopt when an
// intermediate or the result leaves the u64/i64 range of the persisted
// fields; callers map that to math_overflow.
namespace warden::execution::fee_math {

struct deposit_split final {
  warden::schema::amount_t fee{};
  warden::schema::amount_t trading_balance{};
};

/// fee = amount * 250 / 10000 (truncating), trading_balance = amount - fee.
std::optional<deposit_split> split_deposit(warden::schema::amount_t amount);

/// funded_at + duration_days * 86400.
std::optional<warden::schema::timestamp_seconds_t> compute_expiry(
    warden::schema::timestamp_seconds_t funded_at,
    uint16_t duration_days);

/// Whole days between two instants, truncated toward zero. Negative when the
/// clock went backwards.
std::optional<int64_t> elapsed_days(
    warden::schema::timestamp_seconds_t now,
    warden::schema::timestamp_seconds_t since);

/// days * DAILY_COMPUTE_FEE for a positive day count.
std::optional<warden::schema::amount_t> compute_fee_for_days(int64_t days);

std::optional<warden::schema::amount_t> checked_add(
    warden::schema::amount_t lhs,
    warden::schema::amount_t rhs);

std::optional<warden::schema::amount_t> checked_sub(
    warden::schema::amount_t lhs,
    warden::schema::amount_t rhs);

}  // namespace warden::execution::fee_math
