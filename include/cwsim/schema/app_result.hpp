#pragma once

#include <cwsim/schema/event.hpp>
#include <cwsim/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace cwsim::schema {

template <uint16_t Version>
struct app_result;

/// Outcome of an execute or sudo call. `code` 0 is success; otherwise `log`
/// carries the reason and `codespace` names the module that failed.
template <>
struct app_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<event_t> events;

  bool ok() const { return code == 0; }
};

using app_result_t = app_result<1>;

}  // namespace cwsim::schema
