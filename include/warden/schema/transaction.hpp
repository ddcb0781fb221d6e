#pragma once
#include <warden/schema/deduct_compute_fee.hpp>
#include <warden/schema/deposit.hpp>
#include <warden/schema/execute_swap.hpp>
#include <warden/schema/expire_session.hpp>
#include <warden/schema/initialize_session.hpp>
#include <warden/schema/pause_session.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/resume_session.hpp>
#include <warden/schema/withdraw.hpp>
#include <variant>

namespace warden::schema {

using transaction_payload_t = std::variant<initialize_session_t,
                                           deposit_t,
                                           execute_swap_t,
                                           deduct_compute_fee_t,
                                           pause_session_t,
                                           resume_session_t,
                                           withdraw_t,
                                           expire_session_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  identity_t signer{};
  transaction_payload_t payload{};
  ed25519_signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace warden::schema
