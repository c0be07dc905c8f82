#pragma once

#include <cwsim/ledger/types.hpp>
#include <cwsim/schema/app_result.hpp>
#include <cwsim/schema/coin.hpp>
#include <string_view>
#include <vector>

namespace cwsim::ledger {

/// Native balances and supply, persisted in the session store under the
/// `bank|` keyspace. Holds no state of its own.
///
/// Every mutating call validates all coins before writing, so a failed call
/// leaves balances and supply untouched.
class bank_keeper final {
 public:
  static constexpr auto codespace = std::string_view{"cwsim.bank"};

  /// Genesis funding: credit `coins` to `address` and grow supply.
  void init_balance(store_t& store,
                    std::string_view address,
                    const std::vector<cwsim::schema::coin_t>& coins) const;

  /// Privileged mint. Emits `mint{recipient, amount}`.
  cwsim::schema::app_result_t mint(
      store_t& store,
      std::string_view recipient,
      const std::vector<cwsim::schema::coin_t>& coins) const;

  /// Burn from `owner`. Fails with `Overflow: Cannot Sub with <balance> and
  /// <amount>` when the balance is short.
  cwsim::schema::app_result_t burn(
      store_t& store,
      std::string_view owner,
      const std::vector<cwsim::schema::coin_t>& coins) const;

  cwsim::schema::app_result_t send(
      store_t& store,
      std::string_view from,
      std::string_view to,
      const std::vector<cwsim::schema::coin_t>& coins) const;

  cwsim::schema::coin_t balance(const store_t& store,
                                std::string_view address,
                                std::string_view denom) const;

  /// Nonzero balances of `address`, sorted by denom.
  std::vector<cwsim::schema::coin_t> all_balances(
      const store_t& store,
      std::string_view address) const;

  cwsim::schema::coin_t supply(const store_t& store,
                               std::string_view denom) const;

 private:
  void set_balance(store_t& store,
                   std::string_view address,
                   const cwsim::schema::coin_t& value) const;
  void set_supply(store_t& store, const cwsim::schema::coin_t& value) const;
};

}  // namespace cwsim::ledger
