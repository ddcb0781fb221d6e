#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace warden::schema {

enum class transaction_error_code : uint32_t {
  // Envelope and host environment.
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  vault_exists = 10,
  vault_missing = 11,
  insufficient_funds = 12,
  corrupt_vault_record = 13,

  // Escrow rules.
  unauthorized = 100,
  invalid_status = 101,
  deposit_too_small = 102,
  insufficient_balance = 103,
  venue_not_whitelisted = 104,
  session_expired = 105,
  session_not_expired = 106,
  math_overflow = 107,
  too_early_for_deduction = 108,
  invalid_fee_recipient = 109,
};

using transaction_error_mapping_t =
    std::pair<std::string_view, transaction_error_code>;

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    transaction_error_mapping_t{"invalid_transaction",
                                transaction_error_code::invalid_transaction},
    transaction_error_mapping_t{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    transaction_error_mapping_t{"invalid_chain_id",
                                transaction_error_code::invalid_chain_id},
    transaction_error_mapping_t{"invalid_nonce",
                                transaction_error_code::invalid_nonce},
    transaction_error_mapping_t{
        "signature_verification_failed",
        transaction_error_code::signature_verification_failed},
    transaction_error_mapping_t{"vault_exists",
                                transaction_error_code::vault_exists},
    transaction_error_mapping_t{"vault_missing",
                                transaction_error_code::vault_missing},
    transaction_error_mapping_t{"insufficient_funds",
                                transaction_error_code::insufficient_funds},
    transaction_error_mapping_t{"corrupt_vault_record",
                                transaction_error_code::corrupt_vault_record},
    transaction_error_mapping_t{"unauthorized",
                                transaction_error_code::unauthorized},
    transaction_error_mapping_t{"invalid_status",
                                transaction_error_code::invalid_status},
    transaction_error_mapping_t{"deposit_too_small",
                                transaction_error_code::deposit_too_small},
    transaction_error_mapping_t{"insufficient_balance",
                                transaction_error_code::insufficient_balance},
    transaction_error_mapping_t{"venue_not_whitelisted",
                                transaction_error_code::venue_not_whitelisted},
    transaction_error_mapping_t{"session_expired",
                                transaction_error_code::session_expired},
    transaction_error_mapping_t{"session_not_expired",
                                transaction_error_code::session_not_expired},
    transaction_error_mapping_t{"math_overflow",
                                transaction_error_code::math_overflow},
    transaction_error_mapping_t{
        "too_early_for_deduction",
        transaction_error_code::too_early_for_deduction},
    transaction_error_mapping_t{"invalid_fee_recipient",
                                transaction_error_code::invalid_fee_recipient}};

inline constexpr std::string_view to_string(const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

/// Escrow rule violations, as opposed to envelope or host failures.
inline constexpr bool is_escrow_error(const transaction_error_code value) {
  return static_cast<uint32_t>(value) >= 100;
}

}  // namespace warden::schema
