#pragma once

#include <cwsim/modules/module.hpp>
#include <cwsim/modules/token_factory_params.hpp>
#include <string_view>

namespace cwsim::modules {

/// Osmosis-style token factory. Denoms are `<prefix>/<creator>/<subdenom>`
/// and only the creator may mint or burn them.
class token_factory final : public stargate_module {
 public:
  static constexpr auto codespace = std::string_view{"cwsim.tokenfactory"};

  explicit token_factory(token_factory_params params = {});

  const token_factory_params& params() const { return params_; }

  cwsim::schema::app_result_t execute(
      cwsim::ledger::store_t& store,
      cwsim::ledger::router& router,
      const cwsim::schema::block_info_t& block,
      std::string_view sender,
      const cwsim::schema::stargate_msg_t& msg) override;

  /// Stargate queries are not served by this module.
  cwsim::schema::query_result_t query(
      const cwsim::ledger::store_t& store,
      const cwsim::ledger::querier& querier,
      const cwsim::schema::block_info_t& block,
      const cwsim::schema::stargate_query_t& request) const override;

  cwsim::schema::app_result_t sudo(cwsim::ledger::store_t& store,
                                   cwsim::ledger::router& router,
                                   const cwsim::schema::block_info_t& block,
                                   const cwsim::schema::empty_t& msg) override;

 private:
  token_factory_params params_;
};

}  // namespace cwsim::modules
