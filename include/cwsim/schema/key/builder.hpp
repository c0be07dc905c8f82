#pragma once
#include <cwsim/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace cwsim::schema::key {

/// Store key assembly. `write` appends raw bytes; `segment` appends a
/// big-endian u32 length followed by the bytes so that composite keys never
/// alias and a key built from leading segments is a scan prefix.
struct builder final {
  cwsim::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  builder& segment(const std::string_view& str);
  builder& segment(const std::span<const uint8_t>& bytes);
};

}  // namespace cwsim::schema::key
