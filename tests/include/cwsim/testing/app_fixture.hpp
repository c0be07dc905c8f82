#pragma once

#include <cwsim/ledger/app.hpp>
#include <cwsim/modules/coreum/query_module.hpp>
#include <cwsim/modules/coreum/token_factory.hpp>
#include <cwsim/modules/token_factory.hpp>
#include <cwsim/modules/unified_stargate.hpp>
#include <cwsim/testing/common.hpp>

#include <memory>

namespace cwsim::testing {

using coreum_app_t =
    cwsim::ledger::basic_app<cwsim::modules::coreum::custom_query_t>;

/// App whose stargate bridge nests the Osmosis-style token factory.
inline std::unique_ptr<cwsim::ledger::app> make_token_factory_app(
    cwsim::modules::token_factory_params params = {}) {
  return std::make_unique<cwsim::ledger::app>(
      std::make_unique<cwsim::modules::unified_stargate>(
          std::make_unique<cwsim::modules::token_factory>(std::move(params))));
}

/// App wired the way a Coreum chain is: the Coreum token factory behind the
/// stargate bridge and the Coreum custom query module.
inline std::unique_ptr<coreum_app_t> make_coreum_app(
    cwsim::modules::token_factory_params params =
        cwsim::modules::coreum::default_params()) {
  return std::make_unique<coreum_app_t>(
      std::make_unique<cwsim::modules::unified_stargate>(
          std::make_unique<cwsim::modules::coreum::token_factory>(
              std::move(params))),
      std::make_unique<cwsim::modules::coreum::query_module>());
}

}  // namespace cwsim::testing
