#pragma once

#include <warden/schema/primitives.hpp>

#include <cstdint>

// Fixed fee tier and timing constants of the escrow.
namespace warden::schema {

/// Setup fee skimmed at deposit, in basis points.
inline constexpr uint64_t kFeeBps = 250;
inline constexpr uint64_t kBasisPointsDenominator = 10'000;
/// Flat compute fee charged per elapsed day.
inline constexpr amount_t kDailyComputeFee = 10'000'000;
inline constexpr amount_t kMinDeposit = 100'000'000;
inline constexpr timestamp_seconds_t kSecondsPerDay = 86'400;
inline constexpr uint8_t kVaultLayoutTag = 1;

}  // namespace warden::schema
