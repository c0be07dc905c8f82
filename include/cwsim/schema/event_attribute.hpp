#pragma once

#include <cstdint>
#include <string>

namespace cwsim::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;

  bool operator==(const event_attribute&) const = default;
};

using event_attribute_t = event_attribute<1>;

}  // namespace cwsim::schema
