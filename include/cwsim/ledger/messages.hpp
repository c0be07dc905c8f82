#pragma once

#include <cwsim/schema/coin.hpp>
#include <cwsim/schema/stargate.hpp>
#include <string>
#include <variant>
#include <vector>

// Messages a module may hand back to the router.
namespace cwsim::ledger {

struct bank_send final {
  std::string to_address;
  std::vector<cwsim::schema::coin_t> amount;
};

struct bank_burn final {
  std::vector<cwsim::schema::coin_t> amount;
};

/// Privileged supply expansion, only reachable through `router::sudo`.
struct bank_mint final {
  std::string to_address;
  std::vector<cwsim::schema::coin_t> amount;
};

using cosmos_msg_t =
    std::variant<bank_send, bank_burn, cwsim::schema::stargate_msg_t>;
using sudo_msg_t = std::variant<bank_mint>;

}  // namespace cwsim::ledger
