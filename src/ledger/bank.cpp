#include <cosmos/base/v1beta1/coin.pb.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <cwsim/common/critical.hpp>
#include <cwsim/ledger/bank.hpp>
#include <cwsim/schema/encoding/protobuf/coin.hpp>
#include <cwsim/schema/key/builder.hpp>
#include <cwsim/schema/results.hpp>

#include <algorithm>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace cwsim::ledger {

namespace {

using cwsim::schema::amount_t;
using cwsim::schema::app_result_t;
using cwsim::schema::coin_t;
using cwsim::schema::module_error_code;

constexpr auto kBalancePrefix = std::string_view{"bank|balance|"};
constexpr auto kSupplyPrefix = std::string_view{"bank|supply|"};

cwsim::schema::bytes_t make_balance_prefix(const std::string_view address) {
  auto key = cwsim::schema::key::builder{};
  key.write(kBalancePrefix).segment(address);
  return key.data;
}

cwsim::schema::bytes_t make_balance_key(const std::string_view address,
                                        const std::string_view denom) {
  auto key = cwsim::schema::key::builder{};
  key.write(kBalancePrefix).segment(address).segment(denom);
  return key.data;
}

cwsim::schema::bytes_t make_supply_key(const std::string_view denom) {
  auto key = cwsim::schema::key::builder{};
  key.write(kSupplyPrefix).segment(denom);
  return key.data;
}

coin_t decode_stored_coin(const cosmos::base::v1beta1::Coin& stored) {
  auto value = cwsim::schema::encoding::from_proto(stored);
  if (!value.has_value()) {
    cwsim::common::critical("bank record holds an invalid amount");
  }
  return *value;
}

coin_t read_coin(const store_t& store,
                 const cwsim::schema::bytes_t& key,
                 const std::string_view denom) {
  auto encoder = encoder_t{};
  auto stored = store.get<cosmos::base::v1beta1::Coin>(
      encoder, cwsim::schema::make_bytes_view(key));
  if (!stored.has_value()) {
    return coin_t{.denom = std::string{denom}, .amount = 0};
  }
  return decode_stored_coin(*stored);
}

bool add_overflows(const amount_t& lhs, const amount_t& rhs) {
  return lhs > std::numeric_limits<amount_t>::max() - rhs;
}

app_result_t empty_amount_error() {
  return cwsim::schema::make_error_result(module_error_code::invalid_request,
                                          "Cannot transfer empty coins amount",
                                          bank_keeper::codespace);
}

app_result_t sub_overflow_error(const amount_t& have, const amount_t& want) {
  return cwsim::schema::make_error_result(
      module_error_code::insufficient_funds,
      fmt::format("Overflow: Cannot Sub with {} and {}",
                  cwsim::schema::to_string(have),
                  cwsim::schema::to_string(want)),
      bank_keeper::codespace);
}

app_result_t add_overflow_error(const amount_t& have, const amount_t& add) {
  return cwsim::schema::make_error_result(
      module_error_code::invalid_request,
      fmt::format("Overflow: Cannot Add with {} and {}",
                  cwsim::schema::to_string(have),
                  cwsim::schema::to_string(add)),
      bank_keeper::codespace);
}

struct normalized_coins final {
  std::vector<coin_t> coins;
  std::optional<app_result_t> error;
};

// Zero amounts are dropped and a repeated denom is summed into its first
// occurrence. An empty remainder or an overflowing sum is a request error.
normalized_coins normalize(const std::vector<coin_t>& coins) {
  auto out = std::vector<coin_t>{};
  for (const auto& value : coins) {
    if (value.amount == 0) {
      continue;
    }
    auto existing = std::ranges::find(out, value.denom, &coin_t::denom);
    if (existing == out.end()) {
      out.push_back(value);
      continue;
    }
    if (add_overflows(existing->amount, value.amount)) {
      return {.error = add_overflow_error(existing->amount, value.amount)};
    }
    existing->amount += value.amount;
  }
  if (out.empty()) {
    return {.error = empty_amount_error()};
  }
  return {.coins = std::move(out)};
}

}  // namespace

void bank_keeper::init_balance(store_t& store,
                               const std::string_view address,
                               const std::vector<coin_t>& coins) const {
  for (const auto& value : coins) {
    auto current = balance(store, address, value.denom);
    auto total = supply(store, value.denom);
    if (add_overflows(current.amount, value.amount) ||
        add_overflows(total.amount, value.amount)) {
      cwsim::common::critical("genesis balance overflows uint128");
    }
    current.amount += value.amount;
    total.amount += value.amount;
    set_balance(store, address, current);
    set_supply(store, total);
  }
  spdlog::debug("Funded '{}' with [{}]", address,
                cwsim::schema::to_string(coins));
}

app_result_t bank_keeper::mint(store_t& store,
                               const std::string_view recipient,
                               const std::vector<coin_t>& coins) const {
  auto [normalized, error] = normalize(coins);
  if (error) {
    return std::move(*error);
  }
  for (const auto& value : normalized) {
    auto current = balance(store, recipient, value.denom);
    auto total = supply(store, value.denom);
    if (add_overflows(total.amount, value.amount)) {
      return add_overflow_error(total.amount, value.amount);
    }
    if (add_overflows(current.amount, value.amount)) {
      return add_overflow_error(current.amount, value.amount);
    }
  }
  for (const auto& value : normalized) {
    auto current = balance(store, recipient, value.denom);
    auto total = supply(store, value.denom);
    current.amount += value.amount;
    total.amount += value.amount;
    set_balance(store, recipient, current);
    set_supply(store, total);
  }
  auto event = cwsim::schema::make_event("mint");
  event.add_attribute("recipient", std::string{recipient})
      .add_attribute("amount", cwsim::schema::to_string(normalized));
  return cwsim::schema::make_success_result({}, {std::move(event)});
}

app_result_t bank_keeper::burn(store_t& store,
                               const std::string_view owner,
                               const std::vector<coin_t>& coins) const {
  auto [normalized, error] = normalize(coins);
  if (error) {
    return std::move(*error);
  }
  for (const auto& value : normalized) {
    auto current = balance(store, owner, value.denom);
    if (current.amount < value.amount) {
      return sub_overflow_error(current.amount, value.amount);
    }
  }
  for (const auto& value : normalized) {
    auto current = balance(store, owner, value.denom);
    auto total = supply(store, value.denom);
    current.amount -= value.amount;
    total.amount -= value.amount;
    set_balance(store, owner, current);
    set_supply(store, total);
  }
  auto event = cwsim::schema::make_event("burn");
  event.add_attribute("burner", std::string{owner})
      .add_attribute("amount", cwsim::schema::to_string(normalized));
  return cwsim::schema::make_success_result({}, {std::move(event)});
}

app_result_t bank_keeper::send(store_t& store,
                               const std::string_view from,
                               const std::string_view to,
                               const std::vector<coin_t>& coins) const {
  auto [normalized, error] = normalize(coins);
  if (error) {
    return std::move(*error);
  }
  for (const auto& value : normalized) {
    auto current = balance(store, from, value.denom);
    if (current.amount < value.amount) {
      return sub_overflow_error(current.amount, value.amount);
    }
  }
  for (const auto& value : normalized) {
    auto source = balance(store, from, value.denom);
    source.amount -= value.amount;
    set_balance(store, from, source);
    auto target = balance(store, to, value.denom);
    target.amount += value.amount;
    set_balance(store, to, target);
  }
  auto event = cwsim::schema::make_event("transfer");
  event.add_attribute("recipient", std::string{to})
      .add_attribute("sender", std::string{from})
      .add_attribute("amount", cwsim::schema::to_string(normalized));
  return cwsim::schema::make_success_result({}, {std::move(event)});
}

coin_t bank_keeper::balance(const store_t& store,
                            const std::string_view address,
                            const std::string_view denom) const {
  return read_coin(store, make_balance_key(address, denom), denom);
}

std::vector<coin_t> bank_keeper::all_balances(
    const store_t& store,
    const std::string_view address) const {
  auto encoder = encoder_t{};
  auto out = std::vector<coin_t>{};
  auto prefix = make_balance_prefix(address);
  for (const auto& [key, value] :
       store.list_by_prefix(cwsim::schema::make_bytes_view(prefix))) {
    auto stored = encoder.decode<cosmos::base::v1beta1::Coin>(
        cwsim::schema::make_bytes_view(value));
    auto entry = decode_stored_coin(stored);
    if (entry.amount != 0) {
      out.push_back(std::move(entry));
    }
  }
  std::ranges::sort(out, [](const coin_t& lhs, const coin_t& rhs) {
    return lhs.denom < rhs.denom;
  });
  return out;
}

coin_t bank_keeper::supply(const store_t& store,
                           const std::string_view denom) const {
  return read_coin(store, make_supply_key(denom), denom);
}

void bank_keeper::set_balance(store_t& store,
                              const std::string_view address,
                              const coin_t& value) const {
  auto encoder = encoder_t{};
  auto key = make_balance_key(address, value.denom);
  if (value.amount == 0) {
    store.remove(cwsim::schema::make_bytes_view(key));
    return;
  }
  store.put(encoder, cwsim::schema::make_bytes_view(key),
            cwsim::schema::encoding::to_proto(value));
}

void bank_keeper::set_supply(store_t& store, const coin_t& value) const {
  auto encoder = encoder_t{};
  auto key = make_supply_key(value.denom);
  if (value.amount == 0) {
    store.remove(cwsim::schema::make_bytes_view(key));
    return;
  }
  store.put(encoder, cwsim::schema::make_bytes_view(key),
            cwsim::schema::encoding::to_proto(value));
}

}  // namespace cwsim::ledger
