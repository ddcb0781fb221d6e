#include <gtest/gtest.h>
#include <warden/execution/ledger.hpp>
#include <warden/testing/common.hpp>

#include <limits>
#include <map>

namespace {

using warden::schema::transaction_error_code;

const auto kAlice = warden::testing::make_identity(1);
const auto kBob = warden::testing::make_identity(2);
const auto kCarol = warden::testing::make_identity(3);

warden::execution::ledger make_ledger(
    std::map<warden::schema::account_id_t, warden::schema::amount_t> seeded) {
  return warden::execution::ledger{
      [seeded](const warden::schema::account_id_t& account) {
        auto it = seeded.find(account);
        return it == std::end(seeded) ? warden::schema::amount_t{0}
                                      : it->second;
      }};
}

}  // namespace

TEST(ledger, stages_transfers) {
  auto ledger = make_ledger({{kAlice, 100}});
  auto error = ledger.stage({{.from = kAlice, .to = kBob, .amount = 60},
                             {.from = kBob, .to = kCarol, .amount = 10}});
  EXPECT_FALSE(error.has_value());
  EXPECT_EQ(ledger.balance(kAlice), 40u);
  EXPECT_EQ(ledger.balance(kBob), 50u);
  EXPECT_EQ(ledger.balance(kCarol), 10u);
  EXPECT_EQ(ledger.staged().size(), 3u);
}

TEST(ledger, failed_batch_leaves_no_trace) {
  auto ledger = make_ledger({{kAlice, 100}});
  auto error = ledger.stage({{.from = kAlice, .to = kBob, .amount = 60},
                             {.from = kAlice, .to = kCarol, .amount = 50}});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(*error, transaction_error_code::insufficient_funds);
  EXPECT_EQ(ledger.balance(kAlice), 100u);
  EXPECT_EQ(ledger.balance(kBob), 0u);
  EXPECT_TRUE(ledger.staged().empty());
}

TEST(ledger, recipient_overflow_is_rejected) {
  auto ledger = make_ledger(
      {{kAlice, 1}, {kBob, std::numeric_limits<warden::schema::amount_t>::max()}});
  auto error = ledger.stage({{.from = kAlice, .to = kBob, .amount = 1}});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(*error, transaction_error_code::math_overflow);
  EXPECT_EQ(ledger.balance(kAlice), 1u);
}

TEST(ledger, credit_mints) {
  auto ledger = make_ledger({});
  EXPECT_FALSE(ledger.credit(kAlice, 5).has_value());
  EXPECT_FALSE(ledger.credit(kAlice, 7).has_value());
  EXPECT_EQ(ledger.balance(kAlice), 12u);
  EXPECT_EQ(ledger.credit(kAlice, std::numeric_limits<uint64_t>::max()),
            transaction_error_code::math_overflow);
}
