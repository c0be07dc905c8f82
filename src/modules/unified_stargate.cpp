#include <cosmos/bank/v1beta1/query.pb.h>
#include <cosmwasm/wasm/v1/query.pb.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <cwsim/common/critical.hpp>
#include <cwsim/modules/codec.hpp>
#include <cwsim/modules/unified_stargate.hpp>
#include <cwsim/schema/encoding/protobuf/coin.hpp>
#include <cwsim/schema/enum_string.hpp>
#include <cwsim/schema/results.hpp>

#include <array>
#include <utility>

namespace cwsim::modules {

namespace {

using cwsim::schema::module_error_code;
using cwsim::schema::query_result_t;

enum class bridge_path : uint8_t {
  all_balances,
  balance,
  supply_of,
  smart_contract_state,
  contract_info,
};

constexpr auto kBridgePaths =
    std::array<std::pair<std::string_view, bridge_path>, 5>{{
        {"/cosmos.bank.v1beta1.Query/AllBalances", bridge_path::all_balances},
        {"/cosmos.bank.v1beta1.Query/Balance", bridge_path::balance},
        {"/cosmos.bank.v1beta1.Query/SupplyOf", bridge_path::supply_of},
        {"/cosmwasm.wasm.v1.Query/SmartContractState",
         bridge_path::smart_contract_state},
        {"/cosmwasm.wasm.v1.Query/ContractInfo", bridge_path::contract_info},
    }};

query_result_t decode_failure(std::string log) {
  return cwsim::schema::make_query_error(module_error_code::decode_failed,
                                         std::move(log),
                                         unified_stargate::codespace);
}

template <typename Response>
query_result_t respond(const Response& response,
                       const cwsim::schema::block_info_t& block) {
  auto result = cwsim::schema::make_query_success(encode_payload(response));
  result.height = static_cast<int64_t>(block.height);
  return result;
}

query_result_t query_all_balances(const cwsim::ledger::querier& querier,
                                  const cwsim::schema::block_info_t& block,
                                  const cwsim::schema::bytes_t& data) {
  auto error = std::string{};
  auto request =
      decode_payload<cosmos::bank::v1beta1::QueryAllBalancesRequest>(data,
                                                                     error);
  if (!request) {
    return decode_failure(std::move(error));
  }
  auto response = cosmos::bank::v1beta1::QueryAllBalancesResponse{};
  for (const auto& coin : querier.all_balances(request->address())) {
    *response.add_balances() = cwsim::schema::encoding::to_proto(coin);
  }
  return respond(response, block);
}

query_result_t query_balance(const cwsim::ledger::querier& querier,
                             const cwsim::schema::block_info_t& block,
                             const cwsim::schema::bytes_t& data) {
  auto error = std::string{};
  auto request =
      decode_payload<cosmos::bank::v1beta1::QueryBalanceRequest>(data, error);
  if (!request) {
    return decode_failure(std::move(error));
  }
  auto response = cosmos::bank::v1beta1::QueryBalanceResponse{};
  *response.mutable_balance() = cwsim::schema::encoding::to_proto(
      querier.balance(request->address(), request->denom()));
  return respond(response, block);
}

query_result_t query_supply_of(const cwsim::ledger::querier& querier,
                               const cwsim::schema::block_info_t& block,
                               const cwsim::schema::bytes_t& data) {
  auto error = std::string{};
  auto request =
      decode_payload<cosmos::bank::v1beta1::QuerySupplyOfRequest>(data, error);
  if (!request) {
    return decode_failure(std::move(error));
  }
  auto response = cosmos::bank::v1beta1::QuerySupplyOfResponse{};
  *response.mutable_amount() =
      cwsim::schema::encoding::to_proto(querier.supply(request->denom()));
  return respond(response, block);
}

query_result_t query_smart_contract_state(
    const cwsim::ledger::querier& querier,
    const cwsim::schema::block_info_t& block,
    const cwsim::schema::bytes_t& data) {
  auto error = std::string{};
  auto request =
      decode_payload<cosmwasm::wasm::v1::QuerySmartContractStateRequest>(
          data, error);
  if (!request) {
    return decode_failure(std::move(error));
  }
  auto outcome = querier.smart_query(
      request->address(),
      cwsim::schema::make_bytes_view(request->query_data()));
  switch (outcome.status) {
    case cwsim::ledger::smart_query_status::ok:
      break;
    case cwsim::ledger::smart_query_status::contract_error:
      return cwsim::schema::make_query_error(module_error_code::contract_error,
                                             std::move(outcome.error),
                                             unified_stargate::codespace);
    case cwsim::ledger::smart_query_status::system_error:
      return cwsim::schema::make_query_error(
          module_error_code::system_error,
          fmt::format("Querier system error: {}", outcome.error),
          unified_stargate::codespace);
  }
  auto response = cosmwasm::wasm::v1::QuerySmartContractStateResponse{};
  response.set_data(cwsim::schema::make_string(outcome.data));
  return respond(response, block);
}

query_result_t query_contract_info(const cwsim::ledger::querier& querier,
                                   const cwsim::schema::block_info_t& block,
                                   const cwsim::schema::bytes_t& data) {
  auto error = std::string{};
  auto request =
      decode_payload<cosmwasm::wasm::v1::QueryContractInfoRequest>(data, error);
  if (!request) {
    return decode_failure(std::move(error));
  }
  auto info = querier.contract_info(request->address(), error);
  if (!info) {
    return cwsim::schema::make_query_error(
        module_error_code::system_error,
        fmt::format("Querier system error: {}", error),
        unified_stargate::codespace);
  }
  auto response = cosmwasm::wasm::v1::QueryContractInfoResponse{};
  response.set_address(request->address());
  auto* contract = response.mutable_contract_info();
  contract->set_code_id(info->code_id);
  contract->set_creator(info->creator);
  contract->set_admin(info->admin.value_or(""));
  contract->set_label("");
  contract->set_ibc_port_id(info->ibc_port.value_or(""));
  return respond(response, block);
}

}  // namespace

unified_stargate::unified_stargate(std::unique_ptr<stargate_module> extension)
    : extension_{std::move(extension)} {}

cwsim::schema::app_result_t unified_stargate::execute(
    cwsim::ledger::store_t& store,
    cwsim::ledger::router& router,
    const cwsim::schema::block_info_t& block,
    const std::string_view sender,
    const cwsim::schema::stargate_msg_t& msg) {
  if (extension_) {
    return extension_->execute(store, router, block, sender, msg);
  }
  return cwsim::schema::make_error_result(
      module_error_code::unsupported,
      fmt::format("No stargate exec handler for {}", msg.type_url), codespace);
}

query_result_t unified_stargate::query(
    const cwsim::ledger::store_t& store,
    const cwsim::ledger::querier& querier,
    const cwsim::schema::block_info_t& block,
    const cwsim::schema::stargate_query_t& request) const {
  auto path = cwsim::schema::from_string(request.path, kBridgePaths);
  if (!path) {
    if (extension_) {
      return extension_->query(store, querier, block, request);
    }
    return cwsim::schema::make_query_error(
        module_error_code::unsupported,
        fmt::format("Unexpected stargate query: path={}, data={}",
                    request.path,
                    cwsim::schema::to_hex(
                        cwsim::schema::make_bytes_view(request.data))),
        codespace);
  }
  spdlog::debug("Bridging stargate query {}", request.path);
  switch (*path) {
    case bridge_path::all_balances:
      return query_all_balances(querier, block, request.data);
    case bridge_path::balance:
      return query_balance(querier, block, request.data);
    case bridge_path::supply_of:
      return query_supply_of(querier, block, request.data);
    case bridge_path::smart_contract_state:
      return query_smart_contract_state(querier, block, request.data);
    case bridge_path::contract_info:
      return query_contract_info(querier, block, request.data);
  }
  cwsim::common::critical("unhandled stargate bridge path");
}

cwsim::schema::app_result_t unified_stargate::sudo(
    cwsim::ledger::store_t& store,
    cwsim::ledger::router& router,
    const cwsim::schema::block_info_t& block,
    const cwsim::schema::empty_t& msg) {
  if (extension_) {
    return extension_->sudo(store, router, block, msg);
  }
  return cwsim::schema::make_success_result();
}

}  // namespace cwsim::modules
