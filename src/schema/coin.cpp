#include <cwsim/schema/coin.hpp>

#include <algorithm>

namespace cwsim::schema {

namespace {

constexpr auto kIbcHashLength = std::size_t{64};

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

bool is_lower(const char c) {
  return c >= 'a' && c <= 'z';
}

bool is_upper(const char c) {
  return c >= 'A' && c <= 'Z';
}

bool is_upper_hex(const char c) {
  return is_digit(c) || (c >= 'A' && c <= 'F');
}

template <typename Predicate>
bool all_of_nonempty(const std::string_view value, Predicate predicate) {
  return !value.empty() && std::ranges::all_of(value, predicate);
}

// [a-z]+
bool is_native_denom(const std::string_view denom) {
  return all_of_nonempty(denom, is_lower);
}

// (ibc|IBC)/[0-9A-F]{64}
bool is_ibc_denom(const std::string_view denom) {
  if (!denom.starts_with("ibc/") && !denom.starts_with("IBC/")) {
    return false;
  }
  auto hash = denom.substr(4);
  return hash.size() == kIbcHashLength &&
         std::ranges::all_of(hash, is_upper_hex);
}

// factory/[0-9a-z]+/[0-9a-zA-Z]+
bool is_factory_denom(const std::string_view denom) {
  constexpr auto kPrefix = std::string_view{"factory/"};
  if (!denom.starts_with(kPrefix)) {
    return false;
  }
  auto rest = denom.substr(kPrefix.size());
  auto slash = rest.find('/');
  if (slash == std::string_view::npos) {
    return false;
  }
  auto creator = rest.substr(0, slash);
  auto subdenom = rest.substr(slash + 1);
  return all_of_nonempty(creator,
                         [](char c) { return is_digit(c) || is_lower(c); }) &&
         all_of_nonempty(subdenom, [](char c) {
           return is_digit(c) || is_lower(c) || is_upper(c);
         });
}

// [a-z0-9]+-[A-Za-z0-9]+
bool is_coreum_denom(const std::string_view denom) {
  auto dash = denom.find('-');
  if (dash == std::string_view::npos) {
    return false;
  }
  auto subunit = denom.substr(0, dash);
  auto issuer = denom.substr(dash + 1);
  return all_of_nonempty(subunit,
                         [](char c) { return is_digit(c) || is_lower(c); }) &&
         all_of_nonempty(issuer, [](char c) {
           return is_digit(c) || is_lower(c) || is_upper(c);
         });
}

}  // namespace

bool is_valid_denom(const std::string_view denom,
                    const denom_grammar grammar) {
  if (is_native_denom(denom) || is_ibc_denom(denom) ||
      is_factory_denom(denom)) {
    return true;
  }
  return grammar == denom_grammar::coreum && is_coreum_denom(denom);
}

std::optional<coin_t> try_parse_coin(const std::string_view value,
                                     const denom_grammar grammar) {
  auto split = std::ranges::find_if_not(value, is_digit);
  auto digits = static_cast<std::size_t>(split - value.begin());
  auto denom = value.substr(digits);
  if (!is_valid_denom(denom, grammar)) {
    return std::nullopt;
  }
  auto amount = try_parse_amount(value.substr(0, digits));
  if (!amount.has_value()) {
    return std::nullopt;
  }
  return coin_t{.denom = std::string{denom}, .amount = *amount};
}

std::string to_string(const coin_t& value) {
  return to_string(value.amount) + value.denom;
}

std::string to_string(const std::vector<coin_t>& coins) {
  auto out = std::string{};
  for (const auto& value : coins) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += to_string(value);
  }
  return out;
}

}  // namespace cwsim::schema
