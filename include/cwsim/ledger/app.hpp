#pragma once

#include <spdlog/spdlog.h>
#include <cwsim/ledger/bank.hpp>
#include <cwsim/ledger/router.hpp>
#include <cwsim/ledger/wasm.hpp>
#include <cwsim/modules/module.hpp>
#include <cwsim/modules/unified_stargate.hpp>
#include <cwsim/schema/results.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cwsim::ledger {

/// One simulated chain session.
///
/// Owns the store, the bank and wasm keepers, the stargate module and an
/// optional custom query module, and routes calls between them. Top-level
/// `execute` and `sudo` are transactional: a failed call leaves the store
/// exactly as it was before the call.
template <typename CustomQuery = cwsim::schema::empty_t>
class basic_app final : public router {
 public:
  using custom_module_t = cwsim::modules::module<cwsim::schema::empty_t,
                                                 CustomQuery,
                                                 cwsim::schema::empty_t>;

  static constexpr auto codespace = std::string_view{"cwsim.app"};
  /// Seconds added to block time per block, as a CosmWasm test chain does.
  static constexpr auto block_time_seconds = uint64_t{5};

  /// A null `stargate` installs a bare `unified_stargate`.
  explicit basic_app(
      std::unique_ptr<cwsim::modules::stargate_module> stargate = nullptr,
      std::unique_ptr<custom_module_t> custom = nullptr,
      cwsim::schema::block_info_t block = {})
      : stargate_{stargate ? std::move(stargate)
                           : std::make_unique<cwsim::modules::unified_stargate>()},
        custom_{std::move(custom)},
        block_{std::move(block)} {}

  /// Run a message from `sender` as its own transaction.
  cwsim::schema::app_result_t execute(std::string_view sender,
                                      const cosmos_msg_t& msg) {
    auto snapshot = store_.checkpoint();
    auto result = execute(store_, block_, sender, msg);
    if (!result.ok()) {
      spdlog::warn("Execute from '{}' failed with code {}: {}", sender,
                   result.code, result.log);
      store_.restore(std::move(snapshot));
    }
    return result;
  }

  cwsim::schema::app_result_t execute_stargate(std::string_view sender,
                                               std::string type_url,
                                               cwsim::schema::bytes_t value) {
    return execute(sender, cwsim::schema::stargate_msg_t{
                               .type_url = std::move(type_url),
                               .value = std::move(value)});
  }

  cwsim::schema::app_result_t sudo(const sudo_msg_t& msg) {
    auto snapshot = store_.checkpoint();
    auto result = sudo(store_, block_, msg);
    if (!result.ok()) {
      spdlog::warn("Sudo failed with code {}: {}", result.code, result.log);
      store_.restore(std::move(snapshot));
    }
    return result;
  }

  cwsim::schema::app_result_t sudo_stargate() {
    auto snapshot = store_.checkpoint();
    auto result =
        stargate_->sudo(store_, *this, block_, cwsim::schema::empty_t{});
    if (!result.ok()) {
      store_.restore(std::move(snapshot));
    }
    return result;
  }

  cwsim::schema::query_result_t query_stargate(
      const cwsim::schema::stargate_query_t& request) const {
    auto querier = make_querier(store_);
    return stargate_->query(store_, *querier, block_, request);
  }

  cwsim::schema::query_result_t query_stargate(std::string path,
                                               cwsim::schema::bytes_t data) const {
    return query_stargate(cwsim::schema::stargate_query_t{
        .path = std::move(path), .data = std::move(data)});
  }

  cwsim::schema::query_result_t query_custom(const CustomQuery& request) const {
    if (!custom_) {
      return cwsim::schema::make_query_error(
          cwsim::schema::module_error_code::unsupported,
          "No custom query module configured", codespace);
    }
    auto querier = make_querier(store_);
    return custom_->query(store_, *querier, block_, request);
  }

  // router
  cwsim::schema::app_result_t execute(store_t& store,
                                      const cwsim::schema::block_info_t& block,
                                      std::string_view sender,
                                      const cosmos_msg_t& msg) override {
    return std::visit(
        overloaded{
            [&](const bank_send& send) {
              return bank_.send(store, sender, send.to_address, send.amount);
            },
            [&](const bank_burn& burn) {
              return bank_.burn(store, sender, burn.amount);
            },
            [&](const cwsim::schema::stargate_msg_t& stargate) {
              return stargate_->execute(store, *this, block, sender, stargate);
            },
        },
        msg);
  }

  cwsim::schema::app_result_t sudo(store_t& store,
                                   const cwsim::schema::block_info_t&,
                                   const sudo_msg_t& msg) override {
    return std::visit(
        overloaded{
            [&](const bank_mint& mint) {
              return bank_.mint(store, mint.to_address, mint.amount);
            },
        },
        msg);
  }

  std::unique_ptr<querier> make_querier(const store_t& store) const override {
    return std::make_unique<app_querier>(bank_, wasm_, store);
  }

  /// Genesis funding outside any transaction.
  void init_balance(std::string_view address,
                    const std::vector<cwsim::schema::coin_t>& coins) {
    bank_.init_balance(store_, address, coins);
  }

  cwsim::schema::coin_t balance(std::string_view address,
                                std::string_view denom) const {
    return bank_.balance(store_, address, denom);
  }

  std::vector<cwsim::schema::coin_t> all_balances(
      std::string_view address) const {
    return bank_.all_balances(store_, address);
  }

  cwsim::schema::coin_t supply(std::string_view denom) const {
    return bank_.supply(store_, denom);
  }

  void register_contract(std::string address,
                         contract_info_t info,
                         smart_query_handler_t handler) {
    wasm_.register_contract(std::move(address), std::move(info),
                            std::move(handler));
  }

  const cwsim::schema::block_info_t& block() const { return block_; }

  void next_block(uint64_t blocks = 1) {
    block_.height += blocks;
    block_.time += blocks * block_time_seconds * 1'000'000'000ULL;
  }

  const store_t& store() const { return store_; }

 private:
  class app_querier final : public querier {
   public:
    app_querier(const bank_keeper& bank,
                const wasm_keeper& wasm,
                const store_t& store)
        : bank_{bank}, wasm_{wasm}, store_{store} {}

    std::vector<cwsim::schema::coin_t> all_balances(
        std::string_view address) const override {
      return bank_.all_balances(store_, address);
    }

    cwsim::schema::coin_t balance(std::string_view address,
                                  std::string_view denom) const override {
      return bank_.balance(store_, address, denom);
    }

    cwsim::schema::coin_t supply(std::string_view denom) const override {
      return bank_.supply(store_, denom);
    }

    std::optional<contract_info_t> contract_info(
        std::string_view address,
        std::string& error) const override {
      return wasm_.contract_info(address, error);
    }

    smart_query_result smart_query(
        std::string_view address,
        const cwsim::schema::bytes_view_t& msg) const override {
      return wasm_.smart_query(address, msg);
    }

   private:
    const bank_keeper& bank_;
    const wasm_keeper& wasm_;
    const store_t& store_;
  };

  store_t store_;
  bank_keeper bank_;
  wasm_keeper wasm_;
  std::unique_ptr<cwsim::modules::stargate_module> stargate_;
  std::unique_ptr<custom_module_t> custom_;
  cwsim::schema::block_info_t block_;
};

using app = basic_app<>;

}  // namespace cwsim::ledger
