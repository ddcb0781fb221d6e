#include <warden/execution/fee_math.hpp>
#include <warden/execution/ledger.hpp>

#include <utility>

namespace warden::execution {

ledger::ledger(balance_reader_t reader) : reader_{std::move(reader)} {}

warden::schema::amount_t ledger::balance(
    const warden::schema::account_id_t& account) const {
  return balance_in(staged_, account);
}

warden::schema::amount_t ledger::balance_in(
    const balances_t& balances,
    const warden::schema::account_id_t& account) const {
  auto it = balances.find(account);
  if (it != std::end(balances)) {
    return it->second;
  }
  return reader_(account);
}

std::optional<warden::schema::transaction_error_code> ledger::stage(
    const std::vector<warden::schema::transfer_t>& transfers) {
  auto next = staged_;
  for (const auto& transfer : transfers) {
    auto debited =
        fee_math::checked_sub(balance_in(next, transfer.from), transfer.amount);
    if (!debited) {
      return warden::schema::transaction_error_code::insufficient_funds;
    }
    next[transfer.from] = *debited;

    auto credited =
        fee_math::checked_add(balance_in(next, transfer.to), transfer.amount);
    if (!credited) {
      return warden::schema::transaction_error_code::math_overflow;
    }
    next[transfer.to] = *credited;
  }
  staged_ = std::move(next);
  return std::nullopt;
}

std::optional<warden::schema::transaction_error_code> ledger::credit(
    const warden::schema::account_id_t& account,
    const warden::schema::amount_t amount) {
  auto credited = fee_math::checked_add(balance(account), amount);
  if (!credited) {
    return warden::schema::transaction_error_code::math_overflow;
  }
  staged_[account] = *credited;
  return std::nullopt;
}

const ledger::balances_t& ledger::staged() const {
  return staged_;
}

}  // namespace warden::execution
