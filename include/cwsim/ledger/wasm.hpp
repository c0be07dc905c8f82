#pragma once

#include <cwsim/schema/primitives.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cwsim::ledger {

struct contract_info final {
  uint64_t code_id{};
  std::string creator;
  std::optional<std::string> admin;
  bool pinned{};
  std::optional<std::string> ibc_port;
};

using contract_info_t = contract_info;

/// Contract query entry point. Returns response bytes, or nullopt with
/// `error` set when the contract itself rejects the query.
using smart_query_handler_t = std::function<std::optional<cwsim::schema::bytes_t>(
    const cwsim::schema::bytes_view_t& msg,
    std::string& error)>;

enum class smart_query_status : uint8_t { ok, contract_error, system_error };

struct smart_query_result final {
  smart_query_status status{smart_query_status::ok};
  cwsim::schema::bytes_t data;
  std::string error;
};

/// Registry of mock contracts reachable through the querier.
class wasm_keeper final {
 public:
  void register_contract(std::string address,
                         contract_info_t info,
                         smart_query_handler_t handler);

  /// On failure `error` names the missing address.
  std::optional<contract_info_t> contract_info(std::string_view address,
                                               std::string& error) const;

  smart_query_result smart_query(std::string_view address,
                                 const cwsim::schema::bytes_view_t& msg) const;

 private:
  struct registered_contract final {
    contract_info_t info;
    smart_query_handler_t handler;
  };

  std::map<std::string, registered_contract, std::less<>> contracts_;
};

}  // namespace cwsim::ledger
