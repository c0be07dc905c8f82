#pragma once

#include <cstddef>
#include <string>

namespace cwsim::modules {

struct token_factory_params final {
  std::string denom_prefix{"factory"};
  std::size_t max_subdenom_length{32};
  std::size_t max_creator_length{75};
  /// Coin string charged to the issuer on every successful issuance.
  std::string denom_creation_fee{"10000000uosmo"};
};

}  // namespace cwsim::modules
