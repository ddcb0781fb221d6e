#include <gtest/gtest.h>
#include <warden/execution/vault_machine.hpp>
#include <warden/execution/whitelist.hpp>
#include <warden/schema/fee_schedule.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/testing/common.hpp>

#include <cstdint>
#include <limits>
#include <variant>
#include <vector>

namespace {

namespace machine = warden::execution::vault_machine;
using warden::execution::agent_capability;
using warden::execution::crank_capability;
using warden::execution::owner_capability;
using warden::schema::transaction_error_code;
using warden::schema::vault_state_t;
using warden::schema::vault_status_t;

constexpr auto kNow = warden::schema::timestamp_seconds_t{1'700'000'000};
constexpr auto kDay = warden::schema::kSecondsPerDay;

const auto kOwner = warden::testing::make_identity(1);
const auto kAgent = warden::testing::make_identity(2);
const auto kFeeRecipient = warden::testing::make_identity(3);
const auto kStranger = warden::testing::make_identity(4);
const auto kSession = warden::testing::make_session_id(7);
const auto kCustody = warden::schema::key::make_vault_address(kOwner, kSession);

warden::schema::identity_t venue() {
  return warden::execution::venue_whitelist().front();
}

const machine::transition& expect_transition(const machine::result_t& result) {
  EXPECT_TRUE(std::holds_alternative<machine::transition>(result));
  return std::get<machine::transition>(result);
}

transaction_error_code expect_error(const machine::result_t& result) {
  EXPECT_TRUE(std::holds_alternative<transaction_error_code>(result));
  if (!std::holds_alternative<transaction_error_code>(result)) {
    return transaction_error_code::invalid_transaction;
  }
  return std::get<transaction_error_code>(result);
}

vault_state_t make_pending(const uint16_t duration_days = 7) {
  auto result = machine::initialize(
      owner_capability{.signer = kOwner},
      warden::schema::initialize_session_t{.session_id = kSession,
                                           .duration_days = duration_days,
                                           .agent = kAgent,
                                           .fee_recipient = kFeeRecipient},
      kNow);
  return expect_transition(result).vault;
}

vault_state_t make_active(const warden::schema::amount_t amount = 1'000'000'000,
                          const uint16_t duration_days = 7) {
  auto result = machine::deposit(
      make_pending(duration_days), kCustody, owner_capability{.signer = kOwner},
      warden::schema::deposit_t{.owner = kOwner,
                                .session_id = kSession,
                                .amount = amount,
                                .fee_recipient = kFeeRecipient},
      kNow);
  return expect_transition(result).vault;
}

warden::schema::deduct_compute_fee_t deduct_args() {
  return warden::schema::deduct_compute_fee_t{
      .owner = kOwner, .session_id = kSession, .fee_recipient = kFeeRecipient};
}

warden::schema::execute_swap_t swap_args(const warden::schema::amount_t amount_in) {
  return warden::schema::execute_swap_t{.owner = kOwner,
                                        .session_id = kSession,
                                        .amount_in = amount_in,
                                        .minimum_amount_out = 1,
                                        .venue = venue()};
}

}  // namespace

TEST(vault_machine, initialize_creates_pending_vault) {
  auto vault = make_pending(30);
  EXPECT_EQ(vault.owner, kOwner);
  EXPECT_EQ(vault.agent, kAgent);
  EXPECT_EQ(vault.fee_recipient, kFeeRecipient);
  EXPECT_EQ(vault.session_id, kSession);
  EXPECT_EQ(vault.duration_days, 30u);
  EXPECT_EQ(vault.status, vault_status_t::pending);
  EXPECT_EQ(vault.balance, 0u);
  EXPECT_EQ(vault.fee_collected, 0u);
  EXPECT_EQ(vault.compute_fees_paid, 0u);
  EXPECT_EQ(vault.created_at, kNow);
  EXPECT_EQ(vault.funded_at, 0);
  EXPECT_EQ(vault.expires_at, 0);
  EXPECT_EQ(vault.last_fee_deduction, 0);
}

TEST(vault_machine, initialize_emits_session_created_without_transfers) {
  auto result = machine::initialize(
      owner_capability{.signer = kOwner},
      warden::schema::initialize_session_t{.session_id = kSession,
                                           .duration_days = 3,
                                           .agent = kAgent,
                                           .fee_recipient = kFeeRecipient},
      kNow);
  const auto& next = expect_transition(result);
  EXPECT_TRUE(next.transfers.empty());
  const auto* created =
      std::get_if<warden::schema::session_created_t>(&next.event);
  ASSERT_NE(created, nullptr);
  EXPECT_EQ(created->owner, kOwner);
  EXPECT_EQ(created->agent, kAgent);
  EXPECT_EQ(created->duration_days, 3u);
}

TEST(vault_machine, initialize_rejects_agent_on_receiving_side) {
  EXPECT_EQ(expect_error(machine::initialize(
                owner_capability{.signer = kOwner},
                warden::schema::initialize_session_t{
                    .session_id = kSession,
                    .duration_days = 1,
                    .agent = kOwner,
                    .fee_recipient = kFeeRecipient},
                kNow)),
            transaction_error_code::unauthorized);
  EXPECT_EQ(expect_error(machine::initialize(
                owner_capability{.signer = kOwner},
                warden::schema::initialize_session_t{.session_id = kSession,
                                                     .duration_days = 1,
                                                     .agent = kAgent,
                                                     .fee_recipient = kAgent},
                kNow)),
            transaction_error_code::invalid_fee_recipient);
}

TEST(vault_machine, deposit_splits_platform_fee) {
  auto result = machine::deposit(
      make_pending(1), kCustody, owner_capability{.signer = kOwner},
      warden::schema::deposit_t{.owner = kOwner,
                                .session_id = kSession,
                                .amount = 1'000'000'000,
                                .fee_recipient = kFeeRecipient},
      kNow);
  const auto& next = expect_transition(result);
  EXPECT_EQ(next.vault.status, vault_status_t::active);
  EXPECT_EQ(next.vault.fee_collected, 25'000'000u);
  EXPECT_EQ(next.vault.balance, 975'000'000u);
  EXPECT_EQ(next.vault.funded_at, kNow);
  EXPECT_EQ(next.vault.last_fee_deduction, kNow);
  EXPECT_EQ(next.vault.expires_at, kNow + kDay);

  auto expected = std::vector<warden::schema::transfer_t>{
      {.from = kOwner, .to = kCustody, .amount = 975'000'000},
      {.from = kOwner, .to = kFeeRecipient, .amount = 25'000'000}};
  EXPECT_EQ(next.transfers, expected);

  const auto* deposited =
      std::get_if<warden::schema::deposited_t>(&next.event);
  ASSERT_NE(deposited, nullptr);
  EXPECT_EQ(deposited->amount, 1'000'000'000u);
  EXPECT_EQ(deposited->fee, 25'000'000u);
  EXPECT_EQ(deposited->trading_balance, 975'000'000u);
  EXPECT_EQ(deposited->expires_at, kNow + kDay);
}

TEST(vault_machine, deposit_at_minimum_is_accepted_and_below_rejected) {
  auto vault = make_active(warden::schema::kMinDeposit);
  EXPECT_EQ(vault.fee_collected, 2'500'000u);
  EXPECT_EQ(vault.balance, 97'500'000u);

  EXPECT_EQ(expect_error(machine::deposit(
                make_pending(), kCustody, owner_capability{.signer = kOwner},
                warden::schema::deposit_t{
                    .owner = kOwner,
                    .session_id = kSession,
                    .amount = warden::schema::kMinDeposit - 1,
                    .fee_recipient = kFeeRecipient},
                kNow)),
            transaction_error_code::deposit_too_small);
}

TEST(vault_machine, deposit_guard_order) {
  // Fee recipient is checked before amount, status and owner.
  EXPECT_EQ(expect_error(machine::deposit(
                make_active(), kCustody, owner_capability{.signer = kStranger},
                warden::schema::deposit_t{.owner = kOwner,
                                          .session_id = kSession,
                                          .amount = 1,
                                          .fee_recipient = kStranger},
                kNow)),
            transaction_error_code::invalid_fee_recipient);
  EXPECT_EQ(expect_error(machine::deposit(
                make_active(), kCustody, owner_capability{.signer = kStranger},
                warden::schema::deposit_t{.owner = kOwner,
                                          .session_id = kSession,
                                          .amount = 1,
                                          .fee_recipient = kFeeRecipient},
                kNow)),
            transaction_error_code::deposit_too_small);
  EXPECT_EQ(expect_error(machine::deposit(
                make_active(), kCustody, owner_capability{.signer = kStranger},
                warden::schema::deposit_t{.owner = kOwner,
                                          .session_id = kSession,
                                          .amount = 500'000'000,
                                          .fee_recipient = kFeeRecipient},
                kNow)),
            transaction_error_code::invalid_status);
  EXPECT_EQ(expect_error(machine::deposit(
                make_pending(), kCustody, owner_capability{.signer = kStranger},
                warden::schema::deposit_t{.owner = kOwner,
                                          .session_id = kSession,
                                          .amount = 500'000'000,
                                          .fee_recipient = kFeeRecipient},
                kNow)),
            transaction_error_code::unauthorized);
}

TEST(vault_machine, deposit_expiry_overflow_is_reported) {
  EXPECT_EQ(expect_error(machine::deposit(
                make_pending(std::numeric_limits<uint16_t>::max()), kCustody,
                owner_capability{.signer = kOwner},
                warden::schema::deposit_t{.owner = kOwner,
                                          .session_id = kSession,
                                          .amount = 500'000'000,
                                          .fee_recipient = kFeeRecipient},
                std::numeric_limits<int64_t>::max() - 10)),
            transaction_error_code::math_overflow);
}

TEST(vault_machine, swap_moves_no_value_and_carries_minimum_out) {
  auto vault = make_active();
  auto result = machine::execute_swap(vault, agent_capability{.signer = kAgent},
                                      swap_args(vault.balance), kNow + 60);
  const auto& next = expect_transition(result);
  EXPECT_EQ(next.vault, vault);
  EXPECT_TRUE(next.transfers.empty());
  const auto* swap = std::get_if<warden::schema::swap_executed_t>(&next.event);
  ASSERT_NE(swap, nullptr);
  EXPECT_EQ(swap->agent, kAgent);
  EXPECT_EQ(swap->venue, venue());
  EXPECT_EQ(swap->amount_in, vault.balance);
  EXPECT_EQ(swap->minimum_amount_out, 1u);
  EXPECT_EQ(swap->timestamp, kNow + 60);
}

TEST(vault_machine, swap_guard_order) {
  auto vault = make_active();
  auto paused = vault;
  paused.status = vault_status_t::paused;

  // Status first, even for a stranger past expiry.
  EXPECT_EQ(expect_error(machine::execute_swap(
                paused, agent_capability{.signer = kStranger},
                swap_args(vault.balance + 1), vault.expires_at + 1)),
            transaction_error_code::invalid_status);
  EXPECT_EQ(expect_error(machine::execute_swap(
                vault, agent_capability{.signer = kOwner},
                swap_args(vault.balance + 1), vault.expires_at + 1)),
            transaction_error_code::unauthorized);
  EXPECT_EQ(expect_error(machine::execute_swap(
                vault, agent_capability{.signer = kAgent},
                swap_args(vault.balance + 1), vault.expires_at)),
            transaction_error_code::session_expired);
  EXPECT_EQ(expect_error(machine::execute_swap(
                vault, agent_capability{.signer = kAgent},
                swap_args(vault.balance + 1), kNow)),
            transaction_error_code::insufficient_balance);

  auto args = swap_args(1);
  args.venue = kStranger;
  EXPECT_EQ(expect_error(machine::execute_swap(
                vault, agent_capability{.signer = kAgent}, args, kNow)),
            transaction_error_code::venue_not_whitelisted);
}

TEST(vault_machine, swap_allowed_one_second_before_expiry) {
  auto vault = make_active();
  auto result = machine::execute_swap(vault, agent_capability{.signer = kAgent},
                                      swap_args(1), vault.expires_at - 1);
  EXPECT_TRUE(std::holds_alternative<machine::transition>(result));
}

TEST(vault_machine, compute_fee_requires_a_full_day) {
  auto vault = make_active();
  EXPECT_EQ(expect_error(machine::deduct_compute_fee(
                vault, kCustody, crank_capability{.signer = kStranger},
                deduct_args(), kNow + kDay - 1)),
            transaction_error_code::too_early_for_deduction);
  // A clock that moved backwards yields a negative day count.
  EXPECT_EQ(expect_error(machine::deduct_compute_fee(
                vault, kCustody, crank_capability{.signer = kStranger},
                deduct_args(), kNow - 2 * kDay)),
            transaction_error_code::too_early_for_deduction);
}

TEST(vault_machine, compute_fee_rejects_repeat_in_same_second) {
  auto vault = make_active();
  auto first = machine::deduct_compute_fee(
      vault, kCustody, crank_capability{.signer = kStranger}, deduct_args(),
      kNow + kDay);
  const auto& charged = expect_transition(first);
  EXPECT_EQ(charged.vault.compute_fees_paid, warden::schema::kDailyComputeFee);

  EXPECT_EQ(expect_error(machine::deduct_compute_fee(
                charged.vault, kCustody, crank_capability{.signer = kStranger},
                deduct_args(), kNow + kDay)),
            transaction_error_code::too_early_for_deduction);
}

TEST(vault_machine, compute_fee_charges_whole_days) {
  auto vault = make_active();
  auto result = machine::deduct_compute_fee(
      vault, kCustody, crank_capability{.signer = kStranger}, deduct_args(),
      kNow + 3 * kDay + 100);
  const auto& next = expect_transition(result);
  EXPECT_EQ(next.vault.balance, 975'000'000u - 30'000'000u);
  EXPECT_EQ(next.vault.compute_fees_paid, 30'000'000u);
  EXPECT_EQ(next.vault.last_fee_deduction, kNow + 3 * kDay + 100);
  EXPECT_EQ(next.vault.status, vault_status_t::active);

  auto expected = std::vector<warden::schema::transfer_t>{
      {.from = kCustody, .to = kFeeRecipient, .amount = 30'000'000}};
  EXPECT_EQ(next.transfers, expected);

  const auto* deducted =
      std::get_if<warden::schema::compute_fee_deducted_t>(&next.event);
  ASSERT_NE(deducted, nullptr);
  EXPECT_EQ(deducted->fee, 30'000'000u);
  EXPECT_EQ(deducted->remaining_balance, next.vault.balance);
}

TEST(vault_machine, compute_fee_is_capped_and_drains_to_expired) {
  auto vault = make_active(warden::schema::kMinDeposit, 30);
  auto result = machine::deduct_compute_fee(
      vault, kCustody, crank_capability{.signer = kStranger}, deduct_args(),
      kNow + 20 * kDay);
  const auto& next = expect_transition(result);
  EXPECT_EQ(next.vault.balance, 0u);
  EXPECT_EQ(next.vault.compute_fees_paid, 97'500'000u);
  EXPECT_EQ(next.vault.status, vault_status_t::expired);
  ASSERT_EQ(next.transfers.size(), 1u);
  EXPECT_EQ(next.transfers.front().amount, 97'500'000u);
}

TEST(vault_machine, compute_fee_guard_order) {
  auto vault = make_active();
  auto args = deduct_args();
  args.fee_recipient = kStranger;
  auto withdrawn = vault;
  withdrawn.status = vault_status_t::withdrawn;
  EXPECT_EQ(expect_error(machine::deduct_compute_fee(
                withdrawn, kCustody, crank_capability{.signer = kStranger},
                args, kNow)),
            transaction_error_code::invalid_fee_recipient);
  EXPECT_EQ(expect_error(machine::deduct_compute_fee(
                withdrawn, kCustody, crank_capability{.signer = kStranger},
                deduct_args(), kNow + 2 * kDay)),
            transaction_error_code::invalid_status);
  EXPECT_EQ(expect_error(machine::deduct_compute_fee(
                make_pending(), kCustody, crank_capability{.signer = kStranger},
                deduct_args(), kNow + 2 * kDay)),
            transaction_error_code::invalid_status);
}

TEST(vault_machine, compute_fee_applies_while_paused) {
  auto vault = make_active();
  vault.status = vault_status_t::paused;
  auto result = machine::deduct_compute_fee(
      vault, kCustody, crank_capability{.signer = kStranger}, deduct_args(),
      kNow + kDay);
  const auto& next = expect_transition(result);
  EXPECT_EQ(next.vault.status, vault_status_t::paused);
  EXPECT_EQ(next.vault.compute_fees_paid, warden::schema::kDailyComputeFee);
}

TEST(vault_machine, pause_and_resume) {
  auto vault = make_active();
  auto paused = expect_transition(
                    machine::pause(vault, owner_capability{.signer = kOwner}))
                    .vault;
  EXPECT_EQ(paused.status, vault_status_t::paused);
  EXPECT_EQ(expect_error(machine::pause(paused, owner_capability{.signer = kOwner})),
            transaction_error_code::invalid_status);

  auto resumed = expect_transition(machine::resume(
                                       paused, owner_capability{.signer = kOwner},
                                       kNow + 10))
                     .vault;
  EXPECT_EQ(resumed.status, vault_status_t::active);
  EXPECT_EQ(expect_error(machine::resume(
                resumed, owner_capability{.signer = kOwner}, kNow + 10)),
            transaction_error_code::invalid_status);
}

TEST(vault_machine, pause_resume_check_owner_before_status) {
  auto vault = make_pending();
  EXPECT_EQ(expect_error(machine::pause(vault, owner_capability{.signer = kAgent})),
            transaction_error_code::unauthorized);
  EXPECT_EQ(expect_error(machine::resume(
                vault, owner_capability{.signer = kAgent}, kNow)),
            transaction_error_code::unauthorized);
}

TEST(vault_machine, resume_after_expiry_is_rejected) {
  auto vault = make_active();
  vault.status = vault_status_t::paused;
  EXPECT_EQ(expect_error(machine::resume(
                vault, owner_capability{.signer = kOwner}, vault.expires_at)),
            transaction_error_code::session_expired);
}

TEST(vault_machine, withdraw_returns_balance_to_owner) {
  for (auto status : {vault_status_t::active, vault_status_t::paused,
                      vault_status_t::expired}) {
    auto vault = make_active();
    vault.status = status;
    auto result =
        machine::withdraw(vault, kCustody, owner_capability{.signer = kOwner});
    const auto& next = expect_transition(result);
    EXPECT_EQ(next.vault.balance, 0u);
    EXPECT_EQ(next.vault.status, vault_status_t::withdrawn);
    auto expected = std::vector<warden::schema::transfer_t>{
        {.from = kCustody, .to = kOwner, .amount = 975'000'000}};
    EXPECT_EQ(next.transfers, expected);
    const auto* withdrawn =
        std::get_if<warden::schema::withdrawn_t>(&next.event);
    ASSERT_NE(withdrawn, nullptr);
    EXPECT_EQ(withdrawn->amount, 975'000'000u);
    EXPECT_EQ(withdrawn->owner, kOwner);
  }
}

TEST(vault_machine, withdraw_guard_order) {
  EXPECT_EQ(expect_error(machine::withdraw(make_pending(), kCustody,
                                           owner_capability{.signer = kAgent})),
            transaction_error_code::unauthorized);
  EXPECT_EQ(expect_error(machine::withdraw(make_pending(), kCustody,
                                           owner_capability{.signer = kOwner})),
            transaction_error_code::invalid_status);

  auto drained = make_active();
  drained.balance = 0;
  drained.status = vault_status_t::expired;
  EXPECT_EQ(expect_error(machine::withdraw(drained, kCustody,
                                           owner_capability{.signer = kOwner})),
            transaction_error_code::insufficient_balance);

  auto withdrawn = make_active();
  withdrawn.balance = 0;
  withdrawn.status = vault_status_t::withdrawn;
  EXPECT_EQ(expect_error(machine::withdraw(withdrawn, kCustody,
                                           owner_capability{.signer = kOwner})),
            transaction_error_code::insufficient_balance);
}

TEST(vault_machine, withdrawn_vault_is_terminal) {
  auto vault = make_active();
  auto result =
      machine::withdraw(vault, kCustody, owner_capability{.signer = kOwner});
  const auto withdrawn = expect_transition(result).vault;
  ASSERT_EQ(withdrawn.status, vault_status_t::withdrawn);

  const auto now = kNow + kDay;
  const auto owner = owner_capability{.signer = kOwner};
  const auto crank = crank_capability{.signer = kStranger};
  struct attempt final {
    const char* name;
    machine::result_t result;
    transaction_error_code expected;
  };
  const auto attempts = std::vector<attempt>{
      {"deposit",
       machine::deposit(withdrawn, kCustody, owner,
                        warden::schema::deposit_t{
                            .owner = kOwner,
                            .session_id = kSession,
                            .amount = warden::schema::kMinDeposit,
                            .fee_recipient = kFeeRecipient},
                        now),
       transaction_error_code::invalid_status},
      {"execute_swap",
       machine::execute_swap(withdrawn, agent_capability{.signer = kAgent},
                             swap_args(1), now),
       transaction_error_code::invalid_status},
      {"deduct_compute_fee",
       machine::deduct_compute_fee(withdrawn, kCustody, crank, deduct_args(),
                                   now),
       transaction_error_code::invalid_status},
      {"pause", machine::pause(withdrawn, owner),
       transaction_error_code::invalid_status},
      {"resume", machine::resume(withdrawn, owner, now),
       transaction_error_code::invalid_status},
      {"expire", machine::expire(withdrawn, crank, withdrawn.expires_at),
       transaction_error_code::invalid_status},
      {"withdraw", machine::withdraw(withdrawn, kCustody, owner),
       transaction_error_code::insufficient_balance},
  };
  for (const auto& entry : attempts) {
    SCOPED_TRACE(entry.name);
    EXPECT_EQ(expect_error(entry.result), entry.expected);
  }
}

TEST(vault_machine, expire_at_boundary) {
  auto vault = make_active(1'000'000'000, 1);
  EXPECT_EQ(expect_error(machine::expire(vault, crank_capability{.signer = kStranger},
                                         vault.expires_at - 1)),
            transaction_error_code::session_not_expired);

  auto result = machine::expire(vault, crank_capability{.signer = kStranger},
                                vault.expires_at);
  const auto& next = expect_transition(result);
  EXPECT_EQ(next.vault.status, vault_status_t::expired);
  EXPECT_EQ(next.vault.balance, vault.balance);
  EXPECT_TRUE(next.transfers.empty());

  EXPECT_EQ(expect_error(machine::expire(next.vault,
                                         crank_capability{.signer = kStranger},
                                         vault.expires_at + kDay)),
            transaction_error_code::invalid_status);
  EXPECT_EQ(expect_error(machine::expire(make_pending(),
                                         crank_capability{.signer = kStranger},
                                         kNow + 100 * kDay)),
            transaction_error_code::invalid_status);
}

TEST(vault_machine, agent_never_receives_value) {
  auto vault = make_active();
  auto results = std::vector<machine::result_t>{
      machine::execute_swap(vault, agent_capability{.signer = kAgent},
                            swap_args(10), kNow + 1),
      machine::deduct_compute_fee(vault, kCustody,
                                  crank_capability{.signer = kAgent},
                                  deduct_args(), kNow + 2 * kDay),
      machine::withdraw(vault, kCustody, owner_capability{.signer = kOwner}),
      machine::expire(vault, crank_capability{.signer = kAgent},
                      vault.expires_at)};
  for (const auto& result : results) {
    const auto& next = expect_transition(result);
    for (const auto& transfer : next.transfers) {
      EXPECT_NE(transfer.to, kAgent);
    }
  }
}

TEST(vault_machine, balance_never_exceeds_deposit_net_of_fee) {
  auto vault = make_active(123'456'789);
  auto net = vault.balance;
  EXPECT_EQ(vault.balance + vault.fee_collected, 123'456'789u);
  for (auto day = 1; day <= 15; ++day) {
    auto result = machine::deduct_compute_fee(
        vault, kCustody, crank_capability{.signer = kStranger}, deduct_args(),
        kNow + day * kDay);
    if (!std::holds_alternative<machine::transition>(result)) {
      break;
    }
    vault = std::get<machine::transition>(result).vault;
    EXPECT_LE(vault.balance, net);
    EXPECT_EQ(vault.balance + vault.compute_fees_paid, net);
  }
  EXPECT_EQ(vault.status, vault_status_t::expired);
}
