#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cwsim::common {

/// Log and terminate on a broken internal invariant (corrupt store record,
/// unencodable message). Request-level failures never come through here.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace cwsim::common
