#pragma once
#include <cosmos/base/v1beta1/coin.pb.h>
#include <cwsim/schema/coin.hpp>
#include <optional>
#include <string>

namespace cwsim::schema::encoding {

inline cosmos::base::v1beta1::Coin to_proto(const cwsim::schema::coin_t& value) {
  auto out = cosmos::base::v1beta1::Coin{};
  out.set_denom(value.denom);
  out.set_amount(cwsim::schema::to_string(value.amount));
  return out;
}

/// Nullopt when the amount is not a decimal uint128.
inline std::optional<cwsim::schema::coin_t> from_proto(
    const cosmos::base::v1beta1::Coin& value) {
  auto amount = cwsim::schema::try_parse_amount(value.amount());
  if (!amount.has_value()) {
    return std::nullopt;
  }
  return cwsim::schema::coin_t{.denom = value.denom(), .amount = *amount};
}

}  // namespace cwsim::schema::encoding
