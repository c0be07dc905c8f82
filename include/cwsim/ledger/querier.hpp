#pragma once

#include <cwsim/ledger/wasm.hpp>
#include <cwsim/schema/coin.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cwsim::ledger {

/// Read-only view of native ledger state handed to module queries.
class querier {
 public:
  virtual ~querier() = default;

  virtual std::vector<cwsim::schema::coin_t> all_balances(
      std::string_view address) const = 0;

  virtual cwsim::schema::coin_t balance(std::string_view address,
                                        std::string_view denom) const = 0;

  virtual cwsim::schema::coin_t supply(std::string_view denom) const = 0;

  virtual std::optional<contract_info_t> contract_info(
      std::string_view address,
      std::string& error) const = 0;

  virtual smart_query_result smart_query(
      std::string_view address,
      const cwsim::schema::bytes_view_t& msg) const = 0;
};

}  // namespace cwsim::ledger
