#pragma once

#include <gtest/gtest.h>
#include <cwsim/ledger/types.hpp>
#include <cwsim/schema/app_result.hpp>
#include <cwsim/schema/coin.hpp>
#include <cwsim/schema/encoding/protobuf/coin.hpp>
#include <cwsim/schema/stargate.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cwsim::testing {

inline cwsim::schema::coin_t make_coin(const uint64_t amount,
                                       const std::string_view denom) {
  return cwsim::schema::coin_t{.denom = std::string{denom}, .amount = amount};
}

inline cosmos::base::v1beta1::Coin make_proto_coin(
    const uint64_t amount,
    const std::string_view denom) {
  return cwsim::schema::encoding::to_proto(make_coin(amount, denom));
}

/// Stargate envelope carrying `msg` under its descriptor type url.
template <typename T>
cwsim::schema::stargate_msg_t make_stargate_msg(const T& msg) {
  return cwsim::schema::stargate_msg_t{
      .type_url = cwsim::schema::encoding::type_url<T>(),
      .value = cwsim::ledger::encoder_t{}.encode(msg)};
}

template <typename T>
cwsim::schema::stargate_query_t make_stargate_query(std::string path,
                                                    const T& request) {
  return cwsim::schema::stargate_query_t{
      .path = std::move(path), .data = cwsim::ledger::encoder_t{}.encode(request)};
}

template <typename T>
T decode_response(const cwsim::schema::bytes_t& bytes) {
  auto decoded = cwsim::ledger::encoder_t{}.try_decode<T>(
      cwsim::schema::make_bytes_view(bytes));
  EXPECT_TRUE(decoded.has_value())
      << "response does not decode as " << T::descriptor()->full_name();
  return decoded.value_or(T{});
}

/// First event of `type`, or nullptr.
inline const cwsim::schema::event_t* find_event(
    const cwsim::schema::app_result_t& result,
    const std::string_view type) {
  for (const auto& event : result.events) {
    if (event.type == type) {
      return &event;
    }
  }
  return nullptr;
}

inline std::string attribute_or_empty(const cwsim::schema::event_t& event,
                                      const std::string_view key) {
  auto value = event.attribute(key);
  return value ? std::string{*value} : std::string{};
}

}  // namespace cwsim::testing
