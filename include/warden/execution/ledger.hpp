#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_error_code.hpp>
#include <warden/schema/transfer.hpp>

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace warden::execution {

/// Account balances touched by one operation.
///
/// Reads fall through to `reader` until an account is first modified. A set
/// of transfers is staged all-or-nothing: when any transfer cannot be
/// covered, or would overflow the recipient, none of them is applied.
class ledger final {
 public:
  using balance_reader_t =
      std::function<warden::schema::amount_t(const warden::schema::account_id_t&)>;
  using balances_t =
      std::map<warden::schema::account_id_t, warden::schema::amount_t>;

  explicit ledger(balance_reader_t reader);

  warden::schema::amount_t balance(
      const warden::schema::account_id_t& account) const;

  std::optional<warden::schema::transaction_error_code> stage(
      const std::vector<warden::schema::transfer_t>& transfers);

  /// Mint into an account. Used only for genesis funding.
  std::optional<warden::schema::transaction_error_code> credit(
      const warden::schema::account_id_t& account,
      warden::schema::amount_t amount);

  /// Every account whose balance differs from what `reader` returned.
  const balances_t& staged() const;

 private:
  warden::schema::amount_t balance_in(
      const balances_t& balances,
      const warden::schema::account_id_t& account) const;

  balance_reader_t reader_;
  balances_t staged_;
};

}  // namespace warden::execution
