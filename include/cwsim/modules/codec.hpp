#pragma once

#include <spdlog/fmt/fmt.h>
#include <cwsim/ledger/types.hpp>
#include <optional>
#include <string>

namespace cwsim::modules {

/// Decode a stargate payload. On failure `error` names the expected message.
template <typename T>
std::optional<T> decode_payload(const cwsim::schema::bytes_t& bytes,
                                std::string& error) {
  auto encoder = cwsim::ledger::encoder_t{};
  auto decoded =
      encoder.try_decode<T>(cwsim::schema::make_bytes_view(bytes));
  if (!decoded.has_value()) {
    error = fmt::format("failed to decode {}: invalid protobuf encoding",
                        T::descriptor()->name());
  }
  return decoded;
}

template <typename T>
cwsim::schema::bytes_t encode_payload(const T& message) {
  auto encoder = cwsim::ledger::encoder_t{};
  return encoder.encode(message);
}

}  // namespace cwsim::modules
