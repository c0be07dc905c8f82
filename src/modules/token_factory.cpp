#include <cwsim/store/v1/records.pb.h>
#include <osmosis/tokenfactory/v1beta1/tx.pb.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <cwsim/common/critical.hpp>
#include <cwsim/modules/codec.hpp>
#include <cwsim/modules/issuance.hpp>
#include <cwsim/modules/token_factory.hpp>
#include <cwsim/schema/encoding/protobuf/coin.hpp>
#include <cwsim/schema/enum_string.hpp>
#include <cwsim/schema/key/builder.hpp>
#include <cwsim/schema/results.hpp>

#include <array>
#include <utility>

namespace cwsim::modules {

namespace {

using cwsim::schema::app_result_t;
using cwsim::schema::module_error_code;
namespace tf = osmosis::tokenfactory::v1beta1;

enum class factory_message : uint8_t { create_denom, mint, burn };

constexpr auto kFactoryMessages =
    std::array<std::pair<std::string_view, factory_message>, 3>{{
        {"/osmosis.tokenfactory.v1beta1.MsgCreateDenom",
         factory_message::create_denom},
        {"/osmosis.tokenfactory.v1beta1.MsgMint", factory_message::mint},
        {"/osmosis.tokenfactory.v1beta1.MsgBurn", factory_message::burn},
    }};

constexpr auto kDenomPrefix = std::string_view{"tokenfactory|denom|"};

cwsim::schema::bytes_t make_denom_key(const std::string_view denom) {
  auto key = cwsim::schema::key::builder{};
  key.write(kDenomPrefix).segment(denom);
  return key.data;
}

app_result_t fail(const module_error_code code, std::string log) {
  return cwsim::schema::make_error_result(code, std::move(log),
                                          token_factory::codespace);
}

struct checked_coin final {
  cwsim::schema::coin_t coin;
  std::optional<app_result_t> error;
};

checked_coin read_amount(const tf::MsgMint& msg) {
  if (!msg.has_amount()) {
    return {.error = fail(module_error_code::invalid_request,
                          "MsgMint.amount is None")};
  }
  auto coin = cwsim::schema::encoding::from_proto(msg.amount());
  if (!coin) {
    return {.error = fail(module_error_code::invalid_request,
                          fmt::format("Invalid amount `{}`",
                                      msg.amount().amount()))};
  }
  return {.coin = std::move(*coin)};
}

checked_coin read_amount(const tf::MsgBurn& msg) {
  if (!msg.has_amount()) {
    return {.error = fail(module_error_code::invalid_request,
                          "MsgBurn.amount is None")};
  }
  auto coin = cwsim::schema::encoding::from_proto(msg.amount());
  if (!coin) {
    return {.error = fail(module_error_code::invalid_request,
                          fmt::format("Invalid amount `{}`",
                                      msg.amount().amount()))};
  }
  return {.coin = std::move(*coin)};
}

// Denom ownership shared by mint and burn. The structural test is
// `parts != 3 && parts[0] != prefix`: a denom fails only when both the shape
// and the prefix are wrong.
std::optional<app_result_t> check_denom_owner(
    const token_factory_params& params,
    const std::string_view denom,
    const std::string_view sender,
    const std::string_view msg_sender,
    const std::string_view action) {
  auto parts = split(denom, '/');
  if (parts.size() < 2 ||
      (parts.size() != 3 && parts[0] != params.denom_prefix)) {
    return fail(module_error_code::invalid_request, "Invalid denom");
  }
  if (parts[1] != sender) {
    return fail(module_error_code::unauthorized,
                fmt::format("Unauthorized {}. Not the creator of the denom.",
                            action));
  }
  if (sender != msg_sender) {
    return fail(
        module_error_code::unauthorized,
        "Invalid sender. Sender in msg must be same as sender of transaction.");
  }
  return std::nullopt;
}

app_result_t create_denom(const token_factory_params& params,
                          cwsim::ledger::store_t& store,
                          cwsim::ledger::router& router,
                          const cwsim::schema::block_info_t& block,
                          const std::string_view sender,
                          const tf::MsgCreateDenom& msg) {
  if (msg.subdenom().size() > params.max_subdenom_length) {
    return fail(module_error_code::invalid_request,
                fmt::format("Subdenom length is too long, max length is {}",
                            params.max_subdenom_length));
  }
  if (msg.sender().size() > params.max_creator_length) {
    return fail(module_error_code::invalid_request,
                fmt::format("Creator length is too long, max length is {}",
                            params.max_creator_length));
  }
  if (msg.sender().find('/') != std::string::npos) {
    return fail(module_error_code::invalid_request,
                "Invalid creator address, creator address cannot contains '/'");
  }
  if (msg.sender() != sender) {
    return fail(module_error_code::unauthorized,
                "Invalid creator address, creator address must be the same as "
                "the sender");
  }

  auto denom =
      fmt::format("{}/{}/{}", params.denom_prefix, sender, msg.subdenom());
  if (auto failure =
          require_zero_supply(store, router, denom, token_factory::codespace)) {
    return std::move(*failure);
  }
  if (auto failure = charge_creation_fee(
          store, router, block, sender, params.denom_creation_fee,
          cwsim::schema::denom_grammar::standard, token_factory::codespace)) {
    return std::move(*failure);
  }

  auto record = cwsim::store::v1::DenomRecord{};
  record.set_denom(denom);
  record.set_creator(std::string{sender});
  record.set_subdenom(msg.subdenom());
  auto encoder = cwsim::ledger::encoder_t{};
  auto key = make_denom_key(denom);
  store.put(encoder, cwsim::schema::make_bytes_view(key), record);
  spdlog::debug("Created denom '{}'", denom);

  auto response = tf::MsgCreateDenomResponse{};
  response.set_new_token_denom(denom);
  auto event = cwsim::schema::make_event("create_denom");
  event.add_attribute("creator", std::string{sender})
      .add_attribute("new_token_denom", denom);
  return cwsim::schema::make_success_result(encode_payload(response),
                                            {std::move(event)});
}

app_result_t mint(const token_factory_params& params,
                  cwsim::ledger::store_t& store,
                  cwsim::ledger::router& router,
                  const cwsim::schema::block_info_t& block,
                  const std::string_view sender,
                  const tf::MsgMint& msg) {
  auto [coin, error] = read_amount(msg);
  if (error) {
    return std::move(*error);
  }
  if (auto failure =
          check_denom_owner(params, coin.denom, sender, msg.sender(), "mint")) {
    return std::move(*failure);
  }
  auto key = make_denom_key(coin.denom);
  if (!store.contains(cwsim::schema::make_bytes_view(key))) {
    return fail(module_error_code::not_found,
                fmt::format("MsgMint for unknown denom `{}`", coin.denom));
  }
  if (coin.amount == 0) {
    return fail(module_error_code::invalid_request, "Invalid zero amount");
  }

  auto recipient = msg.minttoaddress().empty() ? std::string{sender}
                                               : msg.minttoaddress();
  auto minted = router.sudo(
      store, block,
      cwsim::ledger::bank_mint{.to_address = recipient, .amount = {coin}});
  if (!minted.ok()) {
    return minted;
  }
  spdlog::debug("Minted {} to '{}'", cwsim::schema::to_string(coin),
                recipient);

  auto event = cwsim::schema::make_event("tf_mint");
  event.add_attribute("sender", std::string{sender})
      .add_attribute("mint_to_address", msg.minttoaddress())
      .add_attribute("recipient", recipient)
      .add_attribute("denom", coin.denom)
      .add_attribute("amount", cwsim::schema::to_string(coin.amount));
  return cwsim::schema::make_success_result(
      encode_payload(tf::MsgMintResponse{}), {std::move(event)});
}

app_result_t burn(const token_factory_params& params,
                  cwsim::ledger::store_t& store,
                  cwsim::ledger::router& router,
                  const cwsim::schema::block_info_t& block,
                  const std::string_view sender,
                  const tf::MsgBurn& msg) {
  auto [coin, error] = read_amount(msg);
  if (error) {
    return std::move(*error);
  }
  if (auto failure =
          check_denom_owner(params, coin.denom, sender, msg.sender(), "burn")) {
    return std::move(*failure);
  }
  if (coin.amount == 0) {
    return fail(module_error_code::invalid_request, "Invalid zero amount");
  }

  auto burned = router.execute(store, block, sender,
                               cwsim::ledger::bank_burn{.amount = {coin}});
  if (!burned.ok()) {
    return burned;
  }
  spdlog::debug("Burned {} from '{}'", cwsim::schema::to_string(coin), sender);

  auto event = cwsim::schema::make_event("tf_burn");
  event.add_attribute("burn_from_address", std::string{sender})
      .add_attribute("amount", cwsim::schema::to_string(coin.amount));
  return cwsim::schema::make_success_result(
      encode_payload(tf::MsgBurnResponse{}), {std::move(event)});
}

template <typename Message, typename Handler>
app_result_t decode_and_run(const cwsim::schema::stargate_msg_t& msg,
                            Handler&& handler) {
  auto error = std::string{};
  auto decoded = decode_payload<Message>(msg.value, error);
  if (!decoded) {
    return fail(module_error_code::decode_failed, std::move(error));
  }
  return handler(*decoded);
}

}  // namespace

token_factory::token_factory(token_factory_params params)
    : params_{std::move(params)} {}

app_result_t token_factory::execute(cwsim::ledger::store_t& store,
                                    cwsim::ledger::router& router,
                                    const cwsim::schema::block_info_t& block,
                                    const std::string_view sender,
                                    const cwsim::schema::stargate_msg_t& msg) {
  auto kind = cwsim::schema::from_string(msg.type_url, kFactoryMessages);
  if (!kind) {
    return fail(module_error_code::unsupported,
                fmt::format("Unknown message type {}", msg.type_url));
  }
  switch (*kind) {
    case factory_message::create_denom:
      return decode_and_run<tf::MsgCreateDenom>(msg, [&](const auto& decoded) {
        return create_denom(params_, store, router, block, sender, decoded);
      });
    case factory_message::mint:
      return decode_and_run<tf::MsgMint>(msg, [&](const auto& decoded) {
        return mint(params_, store, router, block, sender, decoded);
      });
    case factory_message::burn:
      return decode_and_run<tf::MsgBurn>(msg, [&](const auto& decoded) {
        return burn(params_, store, router, block, sender, decoded);
      });
  }
  cwsim::common::critical("unhandled token factory message");
}

cwsim::schema::query_result_t token_factory::query(
    const cwsim::ledger::store_t&,
    const cwsim::ledger::querier&,
    const cwsim::schema::block_info_t&,
    const cwsim::schema::stargate_query_t& request) const {
  return cwsim::schema::make_query_error(
      module_error_code::unsupported,
      fmt::format(
          "Unexpected stargate query: path={}, data={}", request.path,
          cwsim::schema::to_hex(cwsim::schema::make_bytes_view(request.data))),
      codespace);
}

app_result_t token_factory::sudo(cwsim::ledger::store_t&,
                                 cwsim::ledger::router&,
                                 const cwsim::schema::block_info_t&,
                                 const cwsim::schema::empty_t&) {
  return cwsim::schema::make_success_result();
}

}  // namespace cwsim::modules
