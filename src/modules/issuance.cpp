#include <spdlog/spdlog.h>
#include <cwsim/modules/issuance.hpp>
#include <cwsim/schema/results.hpp>

namespace cwsim::modules {

std::vector<std::string_view> split(const std::string_view value,
                                    const char delimiter) {
  auto parts = std::vector<std::string_view>{};
  auto start = std::size_t{0};
  while (true) {
    auto end = value.find(delimiter, start);
    if (end == std::string_view::npos) {
      parts.push_back(value.substr(start));
      return parts;
    }
    parts.push_back(value.substr(start, end - start));
    start = end + 1;
  }
}

std::optional<cwsim::schema::app_result_t> require_zero_supply(
    const cwsim::ledger::store_t& store,
    const cwsim::ledger::router& router,
    const std::string_view denom,
    const std::string_view codespace) {
  auto querier = router.make_querier(store);
  if (querier->supply(denom).amount != 0) {
    return cwsim::schema::make_error_result(
        cwsim::schema::module_error_code::already_exists,
        "Subdenom already exists", codespace);
  }
  return std::nullopt;
}

std::optional<cwsim::schema::app_result_t> charge_creation_fee(
    cwsim::ledger::store_t& store,
    cwsim::ledger::router& router,
    const cwsim::schema::block_info_t& block,
    const std::string_view sender,
    const std::string_view fee,
    const cwsim::schema::denom_grammar grammar,
    const std::string_view codespace) {
  auto coin = cwsim::schema::try_parse_coin(fee, grammar);
  if (!coin) {
    return cwsim::schema::make_error_result(
        cwsim::schema::module_error_code::invalid_request, "Invalid sdk string",
        codespace);
  }
  auto burned = router.execute(store, block, sender,
                               cwsim::ledger::bank_burn{.amount = {*coin}});
  if (!burned.ok()) {
    return burned;
  }
  spdlog::debug("Charged creation fee {} to '{}'", cwsim::schema::to_string(*coin),
                sender);
  return std::nullopt;
}

}  // namespace cwsim::modules
