#pragma once

#include <cwsim/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cwsim::schema {

struct coin final {
  std::string denom;
  amount_t amount{};

  bool operator==(const coin&) const = default;
};

using coin_t = coin;

/// Denom shapes accepted by the sdk coin-string parser. `coreum` adds the
/// `<subunit>-<issuer>` shape on top of the standard set.
enum class denom_grammar : uint8_t { standard, coreum };

/// True when `denom` is a native lowercase denom, an `ibc/<64 hex>` denom, a
/// `factory/<creator>/<subdenom>` denom or, for the coreum grammar, a
/// `<subunit>-<issuer>` denom.
bool is_valid_denom(std::string_view denom, denom_grammar grammar);

/// Parse `<amount><denom>` with no separator, e.g. `10000000ucore`.
std::optional<coin_t> try_parse_coin(std::string_view value,
                                     denom_grammar grammar);

std::string to_string(const coin_t& value);

/// Comma separated coin list as rendered in bank event attributes.
std::string to_string(const std::vector<coin_t>& coins);

}  // namespace cwsim::schema
