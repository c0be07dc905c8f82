#pragma once

#include <cwsim/ledger/router.hpp>
#include <cwsim/schema/app_result.hpp>
#include <cwsim/schema/coin.hpp>
#include <optional>
#include <string_view>
#include <vector>

// Steps shared by the fungible issuance paths of both token factories. Each
// returns the failure to hand back to the caller, or nullopt to continue.
namespace cwsim::modules {

std::vector<std::string_view> split(std::string_view value, char delimiter);

/// `Subdenom already exists` when the bank reports nonzero supply.
std::optional<cwsim::schema::app_result_t> require_zero_supply(
    const cwsim::ledger::store_t& store,
    const cwsim::ledger::router& router,
    std::string_view denom,
    std::string_view codespace);

/// Burn the configured creation fee from `sender`. Bank failures are returned
/// unchanged.
std::optional<cwsim::schema::app_result_t> charge_creation_fee(
    cwsim::ledger::store_t& store,
    cwsim::ledger::router& router,
    const cwsim::schema::block_info_t& block,
    std::string_view sender,
    std::string_view fee,
    cwsim::schema::denom_grammar grammar,
    std::string_view codespace);

}  // namespace cwsim::modules
