#include <warden/execution/fee_math.hpp>
#include <warden/schema/fee_schedule.hpp>

#include <limits>

namespace warden::execution::fee_math {

namespace {

using warden::schema::amount_t;
using warden::schema::timestamp_seconds_t;
using warden::schema::wide_amount_t;
using warden::schema::wide_timestamp_t;

const auto kMaxAmount = wide_amount_t{std::numeric_limits<amount_t>::max()};
const auto kMinTimestamp =
    wide_timestamp_t{std::numeric_limits<timestamp_seconds_t>::min()};
const auto kMaxTimestamp =
    wide_timestamp_t{std::numeric_limits<timestamp_seconds_t>::max()};

std::optional<amount_t> narrow_amount(const wide_amount_t& value) {
  if (value > kMaxAmount) {
    return std::nullopt;
  }
  return value.convert_to<amount_t>();
}

std::optional<timestamp_seconds_t> narrow_timestamp(
    const wide_timestamp_t& value) {
  if (value < kMinTimestamp || value > kMaxTimestamp) {
    return std::nullopt;
  }
  return value.convert_to<timestamp_seconds_t>();
}

}  // namespace

std::optional<deposit_split> split_deposit(const amount_t amount) {
  // The product is bounded to u64 before the division.
  auto scaled = narrow_amount(wide_amount_t{amount} *
                              wide_amount_t{warden::schema::kFeeBps});
  if (!scaled) {
    return std::nullopt;
  }
  auto fee = *scaled / warden::schema::kBasisPointsDenominator;
  auto trading_balance = checked_sub(amount, fee);
  if (!trading_balance) {
    return std::nullopt;
  }
  return deposit_split{.fee = fee, .trading_balance = *trading_balance};
}

std::optional<timestamp_seconds_t> compute_expiry(
    const timestamp_seconds_t funded_at,
    const uint16_t duration_days) {
  auto duration = wide_timestamp_t{duration_days} *
                  wide_timestamp_t{warden::schema::kSecondsPerDay};
  return narrow_timestamp(wide_timestamp_t{funded_at} + duration);
}

std::optional<int64_t> elapsed_days(const timestamp_seconds_t now,
                                    const timestamp_seconds_t since) {
  auto elapsed =
      narrow_timestamp(wide_timestamp_t{now} - wide_timestamp_t{since});
  if (!elapsed) {
    return std::nullopt;
  }
  return *elapsed / warden::schema::kSecondsPerDay;
}

std::optional<amount_t> compute_fee_for_days(const int64_t days) {
  if (days < 0) {
    return std::nullopt;
  }
  return narrow_amount(wide_amount_t{static_cast<uint64_t>(days)} *
                       wide_amount_t{warden::schema::kDailyComputeFee});
}

std::optional<amount_t> checked_add(const amount_t lhs, const amount_t rhs) {
  return narrow_amount(wide_amount_t{lhs} + wide_amount_t{rhs});
}

std::optional<amount_t> checked_sub(const amount_t lhs, const amount_t rhs) {
  if (rhs > lhs) {
    return std::nullopt;
  }
  return lhs - rhs;
}

}  // namespace warden::execution::fee_math
