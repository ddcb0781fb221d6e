#include <warden/execution/fee_math.hpp>
#include <warden/execution/vault_machine.hpp>
#include <warden/execution/whitelist.hpp>
#include <warden/schema/fee_schedule.hpp>

#include <algorithm>

namespace warden::execution::vault_machine {

namespace {

using warden::schema::transaction_error_code;
using warden::schema::vault_state_t;
using warden::schema::vault_status_t;

bool is_live(const vault_state_t& vault) {
  return vault.status == vault_status_t::active ||
         vault.status == vault_status_t::paused;
}

}  // namespace

result_t initialize(const owner_capability& caller,
                    const warden::schema::initialize_session_t& args,
                    const warden::schema::timestamp_seconds_t now) {
  // The agent may never end up on the receiving side of a transfer, so it can
  // be neither the owner nor the fee recipient.
  if (args.agent == caller.signer) {
    return transaction_error_code::unauthorized;
  }
  if (args.fee_recipient == args.agent) {
    return transaction_error_code::invalid_fee_recipient;
  }

  auto vault = vault_state_t{};
  vault.owner = caller.signer;
  vault.agent = args.agent;
  vault.fee_recipient = args.fee_recipient;
  vault.session_id = args.session_id;
  vault.duration_days = args.duration_days;
  vault.status = vault_status_t::pending;
  vault.created_at = now;

  return transition{.vault = vault,
                    .transfers = {},
                    .event = warden::schema::session_created_t{
                        .session_id = vault.session_id,
                        .owner = vault.owner,
                        .agent = vault.agent,
                        .duration_days = vault.duration_days}};
}

result_t deposit(const vault_state_t& vault,
                 const warden::schema::vault_address_t& custody,
                 const owner_capability& caller,
                 const warden::schema::deposit_t& args,
                 const warden::schema::timestamp_seconds_t now) {
  if (args.fee_recipient != vault.fee_recipient) {
    return transaction_error_code::invalid_fee_recipient;
  }
  if (args.amount < warden::schema::kMinDeposit) {
    return transaction_error_code::deposit_too_small;
  }
  if (vault.status != vault_status_t::pending) {
    return transaction_error_code::invalid_status;
  }
  if (!holds_role(caller, vault.owner)) {
    return transaction_error_code::unauthorized;
  }

  auto split = fee_math::split_deposit(args.amount);
  if (!split) {
    return transaction_error_code::math_overflow;
  }
  auto expires_at = fee_math::compute_expiry(now, vault.duration_days);
  if (!expires_at) {
    return transaction_error_code::math_overflow;
  }

  auto next = vault;
  next.balance = split->trading_balance;
  next.fee_collected = split->fee;
  next.status = vault_status_t::active;
  next.funded_at = now;
  next.last_fee_deduction = now;
  next.expires_at = *expires_at;

  auto transfers = std::vector<warden::schema::transfer_t>{
      {.from = vault.owner, .to = custody, .amount = split->trading_balance},
      {.from = vault.owner, .to = vault.fee_recipient, .amount = split->fee}};

  return transition{.vault = next,
                    .transfers = std::move(transfers),
                    .event = warden::schema::deposited_t{
                        .session_id = vault.session_id,
                        .amount = args.amount,
                        .fee = split->fee,
                        .trading_balance = split->trading_balance,
                        .expires_at = *expires_at}};
}

result_t execute_swap(const vault_state_t& vault,
                      const agent_capability& caller,
                      const warden::schema::execute_swap_t& args,
                      const warden::schema::timestamp_seconds_t now) {
  if (vault.status != vault_status_t::active) {
    return transaction_error_code::invalid_status;
  }
  if (!holds_role(caller, vault.agent)) {
    return transaction_error_code::unauthorized;
  }
  if (now >= vault.expires_at) {
    return transaction_error_code::session_expired;
  }
  if (args.amount_in > vault.balance) {
    return transaction_error_code::insufficient_balance;
  }
  if (!is_whitelisted_venue(args.venue)) {
    return transaction_error_code::venue_not_whitelisted;
  }

  return transition{.vault = vault,
                    .transfers = {},
                    .event = warden::schema::swap_executed_t{
                        .session_id = vault.session_id,
                        .agent = vault.agent,
                        .venue = args.venue,
                        .amount_in = args.amount_in,
                        .minimum_amount_out = args.minimum_amount_out,
                        .timestamp = now}};
}

result_t deduct_compute_fee(const vault_state_t& vault,
                            const warden::schema::vault_address_t& custody,
                            const crank_capability&,
                            const warden::schema::deduct_compute_fee_t& args,
                            const warden::schema::timestamp_seconds_t now) {
  if (args.fee_recipient != vault.fee_recipient) {
    return transaction_error_code::invalid_fee_recipient;
  }
  if (!is_live(vault)) {
    return transaction_error_code::invalid_status;
  }

  auto days = fee_math::elapsed_days(now, vault.last_fee_deduction);
  if (!days) {
    return transaction_error_code::math_overflow;
  }
  if (*days < 1) {
    return transaction_error_code::too_early_for_deduction;
  }
  auto owed = fee_math::compute_fee_for_days(*days);
  if (!owed) {
    return transaction_error_code::math_overflow;
  }
  auto fee = std::min(*owed, vault.balance);
  auto compute_fees_paid = fee_math::checked_add(vault.compute_fees_paid, fee);
  if (!compute_fees_paid) {
    return transaction_error_code::math_overflow;
  }

  auto next = vault;
  next.balance = vault.balance - fee;
  next.compute_fees_paid = *compute_fees_paid;
  next.last_fee_deduction = now;
  if (next.balance == 0) {
    next.status = vault_status_t::expired;
  }

  auto transfers = std::vector<warden::schema::transfer_t>{};
  if (fee > 0) {
    transfers.push_back(
        {.from = custody, .to = vault.fee_recipient, .amount = fee});
  }

  return transition{.vault = next,
                    .transfers = std::move(transfers),
                    .event = warden::schema::compute_fee_deducted_t{
                        .session_id = vault.session_id,
                        .fee = fee,
                        .remaining_balance = next.balance}};
}

result_t pause(const vault_state_t& vault, const owner_capability& caller) {
  if (!holds_role(caller, vault.owner)) {
    return transaction_error_code::unauthorized;
  }
  if (vault.status != vault_status_t::active) {
    return transaction_error_code::invalid_status;
  }

  auto next = vault;
  next.status = vault_status_t::paused;
  return transition{
      .vault = next,
      .transfers = {},
      .event = warden::schema::session_paused_t{.session_id = vault.session_id}};
}

result_t resume(const vault_state_t& vault,
                const owner_capability& caller,
                const warden::schema::timestamp_seconds_t now) {
  if (!holds_role(caller, vault.owner)) {
    return transaction_error_code::unauthorized;
  }
  if (vault.status != vault_status_t::paused) {
    return transaction_error_code::invalid_status;
  }
  if (now >= vault.expires_at) {
    return transaction_error_code::session_expired;
  }

  auto next = vault;
  next.status = vault_status_t::active;
  return transition{.vault = next,
                    .transfers = {},
                    .event = warden::schema::session_resumed_t{
                        .session_id = vault.session_id}};
}

result_t withdraw(const vault_state_t& vault,
                  const warden::schema::vault_address_t& custody,
                  const owner_capability& caller) {
  if (!holds_role(caller, vault.owner)) {
    return transaction_error_code::unauthorized;
  }
  if (vault.status == vault_status_t::pending) {
    return transaction_error_code::invalid_status;
  }
  if (vault.balance == 0) {
    return transaction_error_code::insufficient_balance;
  }

  auto next = vault;
  next.balance = 0;
  next.status = vault_status_t::withdrawn;
  return transition{
      .vault = next,
      .transfers = {{.from = custody,
                     .to = vault.owner,
                     .amount = vault.balance}},
      .event = warden::schema::withdrawn_t{.session_id = vault.session_id,
                                           .amount = vault.balance,
                                           .owner = vault.owner}};
}

result_t expire(const vault_state_t& vault,
                const crank_capability&,
                const warden::schema::timestamp_seconds_t now) {
  if (!is_live(vault)) {
    return transaction_error_code::invalid_status;
  }
  if (now < vault.expires_at) {
    return transaction_error_code::session_not_expired;
  }

  auto next = vault;
  next.status = vault_status_t::expired;
  return transition{.vault = next,
                    .transfers = {},
                    .event = warden::schema::session_expired_t{
                        .session_id = vault.session_id,
                        .remaining_balance = vault.balance}};
}

}  // namespace warden::execution::vault_machine
