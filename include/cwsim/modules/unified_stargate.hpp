#pragma once

#include <cwsim/modules/module.hpp>
#include <memory>
#include <string_view>

namespace cwsim::modules {

/// Stargate module that answers the bank and wasm gRPC query paths from the
/// native querier. Anything it does not recognise, including every execute
/// and sudo, goes to the optional extension module.
///
/// Recognised query paths:
///   /cosmos.bank.v1beta1.Query/AllBalances
///   /cosmos.bank.v1beta1.Query/Balance
///   /cosmos.bank.v1beta1.Query/SupplyOf
///   /cosmwasm.wasm.v1.Query/SmartContractState
///   /cosmwasm.wasm.v1.Query/ContractInfo
class unified_stargate final : public stargate_module {
 public:
  static constexpr auto codespace = std::string_view{"cwsim.stargate"};

  explicit unified_stargate(
      std::unique_ptr<stargate_module> extension = nullptr);

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

  bool has_extension() const { return extension_ != nullptr; }

 private:
  std::unique_ptr<stargate_module> extension_;
};

}  // namespace cwsim::modules
