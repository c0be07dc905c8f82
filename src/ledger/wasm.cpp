#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <cwsim/ledger/wasm.hpp>

#include <utility>

namespace cwsim::ledger {

void wasm_keeper::register_contract(std::string address,
                                    contract_info_t info,
                                    smart_query_handler_t handler) {
  spdlog::debug("Registering contract '{}' (code {})", address, info.code_id);
  contracts_.insert_or_assign(
      std::move(address),
      registered_contract{.info = std::move(info),
                          .handler = std::move(handler)});
}

std::optional<contract_info_t> wasm_keeper::contract_info(
    const std::string_view address,
    std::string& error) const {
  auto it = contracts_.find(address);
  if (it == contracts_.end()) {
    error = fmt::format("No such contract: {}", address);
    return std::nullopt;
  }
  return it->second.info;
}

smart_query_result wasm_keeper::smart_query(
    const std::string_view address,
    const cwsim::schema::bytes_view_t& msg) const {
  auto it = contracts_.find(address);
  if (it == contracts_.end()) {
    return smart_query_result{.status = smart_query_status::system_error,
                              .error =
                                  fmt::format("No such contract: {}", address)};
  }
  if (!it->second.handler) {
    return smart_query_result{
        .status = smart_query_status::system_error,
        .error = fmt::format("Contract {} has no query entry point", address)};
  }
  auto error = std::string{};
  auto response = it->second.handler(msg, error);
  if (!response.has_value()) {
    return smart_query_result{.status = smart_query_status::contract_error,
                              .error = std::move(error)};
  }
  return smart_query_result{.status = smart_query_status::ok,
                            .data = std::move(*response)};
}

}  // namespace cwsim::ledger
