#pragma once

#include <cwsim/schema/event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Module event: a named record with ordered key/value attributes. Names and
// keys are matched verbatim by contract tests.
namespace cwsim::schema {

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;

  event& add_attribute(std::string key, std::string value) {
    attributes.push_back(event_attribute_t{.key = std::move(key),
                                           .value = std::move(value)});
    return *this;
  }

  std::optional<std::string_view> attribute(const std::string_view key) const {
    for (const auto& attr : attributes) {
      if (attr.key == key) {
        return std::string_view{attr.value};
      }
    }
    return std::nullopt;
  }
};

using event_t = event<1>;

}  // namespace cwsim::schema
