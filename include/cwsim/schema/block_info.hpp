#pragma once

#include <cwsim/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace cwsim::schema {

using timestamp_nanoseconds_t = uint64_t;

template <uint16_t Version>
struct block_info;

template <>
struct block_info<1> final {
  uint16_t version{1};
  uint64_t height{12345};
  timestamp_nanoseconds_t time{1571797419879305533};
  std::string chain_id{"cosmos-testnet-14002"};
};

using block_info_t = block_info<1>;

}  // namespace cwsim::schema
