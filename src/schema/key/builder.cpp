#include <algorithm>
#include <cwsim/common/critical.hpp>
#include <cwsim/schema/key/builder.hpp>
#include <iterator>
#include <limits>

using namespace cwsim::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::segment(const std::string_view& str) {
  return segment(std::span<const uint8_t>{
      reinterpret_cast<const uint8_t*>(str.data()), str.size()});
}

builder& builder::segment(const std::span<const uint8_t>& bytes) {
  // Decoded protobuf strings stay below 2 GiB, so only a caller bug gets here.
  if (bytes.size() > std::numeric_limits<uint32_t>::max()) {
    cwsim::common::critical("key segment exceeds 4 GiB");
  }
  auto length = static_cast<uint32_t>(bytes.size());
  data.push_back(static_cast<uint8_t>((length >> 24u) & 0xFFu));
  data.push_back(static_cast<uint8_t>((length >> 16u) & 0xFFu));
  data.push_back(static_cast<uint8_t>((length >> 8u) & 0xFFu));
  data.push_back(static_cast<uint8_t>(length & 0xFFu));
  return write(bytes);
}
