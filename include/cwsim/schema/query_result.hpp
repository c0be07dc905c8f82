#pragma once

#include <cwsim/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace cwsim::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t value;
  int64_t height{};
  std::string codespace;

  bool ok() const { return code == 0; }
};

using query_result_t = query_result<1>;

}  // namespace cwsim::schema
