#pragma once

#include <cwsim/modules/module.hpp>
#include <cwsim/modules/token_factory_params.hpp>
#include <string_view>

namespace cwsim::modules::coreum {

token_factory_params default_params();

/// Coreum asset module: fungible tokens denominated `<subunit>-<issuer>`
/// plus NFT classes and NFTs. Also answers the Coreum and cosmos NFT query
/// paths over its own records.
class token_factory final : public stargate_module {
 public:
  explicit token_factory(token_factory_params params = default_params());

  const token_factory_params& params() const { return params_; }

  cwsim::schema::app_result_t execute(
      cwsim::ledger::store_t& store,
      cwsim::ledger::router& router,
      const cwsim::schema::block_info_t& block,
      std::string_view sender,
      const cwsim::schema::stargate_msg_t& msg) override;

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

}  // namespace cwsim::modules::coreum
