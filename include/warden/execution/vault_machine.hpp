#pragma once

#include <warden/execution/capability.hpp>
#include <warden/schema/deduct_compute_fee.hpp>
#include <warden/schema/deposit.hpp>
#include <warden/schema/execute_swap.hpp>
#include <warden/schema/initialize_session.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_error_code.hpp>
#include <warden/schema/transfer.hpp>
#include <warden/schema/vault_event.hpp>
#include <warden/schema/vault_state.hpp>

#include <variant>
#include <vector>

// Vault lifecycle state machine.
//
// Every operation is a pure function of (vault, capability, now, inputs). It
// either returns the next vault state together with the transfers that must
// accompany it and the event to emit, or the first failing guard. Nothing is
// read from a clock or from storage here; the caller applies the transfers
// and the new state as one unit or not at all.
namespace warden::execution::vault_machine {

struct transition final {
  warden::schema::vault_state_t vault;
  std::vector<warden::schema::transfer_t> transfers;
  warden::schema::vault_event_t event;
};

using result_t = std::variant<transition, warden::schema::transaction_error_code>;

/// Create a pending vault. The caller checks that no record exists yet.
result_t initialize(const owner_capability& caller,
                    const warden::schema::initialize_session_t& args,
                    warden::schema::timestamp_seconds_t now);

/// Fund a pending vault once. `custody` is the vault's ledger account.
result_t deposit(const warden::schema::vault_state_t& vault,
                 const warden::schema::vault_address_t& custody,
                 const owner_capability& caller,
                 const warden::schema::deposit_t& args,
                 warden::schema::timestamp_seconds_t now);

/// Authorize an agent trade. Moves no value; `minimum_amount_out` is carried
/// through to the event for the venue to enforce.
result_t execute_swap(const warden::schema::vault_state_t& vault,
                      const agent_capability& caller,
                      const warden::schema::execute_swap_t& args,
                      warden::schema::timestamp_seconds_t now);

result_t deduct_compute_fee(const warden::schema::vault_state_t& vault,
                            const warden::schema::vault_address_t& custody,
                            const crank_capability& caller,
                            const warden::schema::deduct_compute_fee_t& args,
                            warden::schema::timestamp_seconds_t now);

result_t pause(const warden::schema::vault_state_t& vault,
               const owner_capability& caller);

result_t resume(const warden::schema::vault_state_t& vault,
                const owner_capability& caller,
                warden::schema::timestamp_seconds_t now);

result_t withdraw(const warden::schema::vault_state_t& vault,
                  const warden::schema::vault_address_t& custody,
                  const owner_capability& caller);

result_t expire(const warden::schema::vault_state_t& vault,
                const crank_capability& caller,
                warden::schema::timestamp_seconds_t now);

}  // namespace warden::execution::vault_machine
