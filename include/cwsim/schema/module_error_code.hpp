#pragma once

#include <cstdint>

namespace cwsim::schema {

enum class module_error_code : uint32_t {
  decode_failed = 1,
  invalid_request = 2,
  unauthorized = 3,
  not_found = 4,
  insufficient_funds = 5,
  unsupported = 6,
  already_exists = 7,
  contract_error = 8,
  system_error = 9,
};

}  // namespace cwsim::schema
