#include <coreum/asset/ft/v1/query.pb.h>
#include <coreum/asset/nft/v1/query.pb.h>
#include <cosmos/nft/v1beta1/query.pb.h>
#include <cosmos/nft/v1beta1/tx.pb.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <cwsim/common/critical.hpp>
#include <cwsim/modules/codec.hpp>
#include <cwsim/modules/coreum/query_module.hpp>
#include <cwsim/modules/coreum/state.hpp>
#include <cwsim/modules/coreum/token_factory.hpp>
#include <cwsim/modules/issuance.hpp>
#include <cwsim/schema/encoding/protobuf/coin.hpp>
#include <cwsim/schema/enum_string.hpp>
#include <cwsim/schema/results.hpp>

#include <array>
#include <utility>

namespace cwsim::modules::coreum {

namespace {

namespace ft_v1 = ::coreum::asset::ft::v1;
namespace nft_v1 = ::coreum::asset::nft::v1;
namespace cosmos_nft = ::cosmos::nft::v1beta1;
using cwsim::schema::app_result_t;
using cwsim::schema::module_error_code;
using cwsim::schema::query_result_t;

enum class coreum_message : uint8_t {
  issue,
  mint,
  burn,
  issue_class,
  nft_mint,
  nft_burn,
  nft_send,
};

constexpr auto kCoreumMessages =
    std::array<std::pair<std::string_view, coreum_message>, 7>{{
        {"/coreum.asset.ft.v1.MsgIssue", coreum_message::issue},
        {"/coreum.asset.ft.v1.MsgMint", coreum_message::mint},
        {"/coreum.asset.ft.v1.MsgBurn", coreum_message::burn},
        {"/coreum.asset.nft.v1.MsgIssueClass", coreum_message::issue_class},
        {"/coreum.asset.nft.v1.MsgMint", coreum_message::nft_mint},
        {"/coreum.asset.nft.v1.MsgBurn", coreum_message::nft_burn},
        {"/cosmos.nft.v1beta1.MsgSend", coreum_message::nft_send},
    }};

enum class coreum_query : uint8_t {
  token,
  tokens,
  class_,
  classes,
  nft,
  nfts,
  owner,
};

// The asset NFT NFTs/Owner paths are accepted as aliases of the cosmos x/nft
// ones.
constexpr auto kCoreumQueries =
    std::array<std::pair<std::string_view, coreum_query>, 9>{{
        {"/coreum.asset.ft.v1.Query/Token", coreum_query::token},
        {"/coreum.asset.ft.v1.Query/Tokens", coreum_query::tokens},
        {"/coreum.asset.nft.v1.Query/Class", coreum_query::class_},
        {"/coreum.asset.nft.v1.Query/Classes", coreum_query::classes},
        {"/cosmos.nft.v1beta1.Query/NFT", coreum_query::nft},
        {"/cosmos.nft.v1beta1.Query/NFTs", coreum_query::nfts},
        {"/cosmos.nft.v1beta1.Query/Owner", coreum_query::owner},
        {"/coreum.asset.nft.v1.Query/NFTs", coreum_query::nfts},
        {"/coreum.asset.nft.v1.Query/Owner", coreum_query::owner},
    }};

app_result_t fail(const module_error_code code, std::string log) {
  return cwsim::schema::make_error_result(code, std::move(log), codespace);
}

// ^[a-zA-Z][a-zA-Z0-9/:._-]{2,127}$
bool matches_denom_format(const std::string_view value) {
  if (value.size() < 3 || value.size() > 128) {
    return false;
  }
  auto is_alpha = [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
  };
  if (!is_alpha(value.front())) {
    return false;
  }
  for (auto c : value.substr(1)) {
    auto allowed = is_alpha(c) || (c >= '0' && c <= '9') || c == '/' ||
                   c == ':' || c == '.' || c == '_' || c == '-';
    if (!allowed) {
      return false;
    }
  }
  return true;
}

app_result_t respond(std::vector<cwsim::schema::event_t> events) {
  return cwsim::schema::make_success_result(
      encode_payload(ft_v1::EmptyResponse{}), std::move(events));
}

app_result_t issue(const token_factory_params& params,
                   cwsim::ledger::store_t& store,
                   cwsim::ledger::router& router,
                   const cwsim::schema::block_info_t& block,
                   const std::string_view sender,
                   const ft_v1::MsgIssue& msg) {
  if (msg.subunit().size() > params.max_subdenom_length) {
    return fail(module_error_code::invalid_request,
                fmt::format("Subdenom length is too long, max length is {}",
                            params.max_subdenom_length));
  }
  if (msg.issuer().size() > params.max_creator_length) {
    return fail(module_error_code::invalid_request,
                fmt::format("Creator length is too long, max length is {}",
                            params.max_creator_length));
  }
  if (msg.issuer().find('/') != std::string::npos) {
    return fail(module_error_code::invalid_request,
                "Invalid creator address, creator address cannot contains '/'");
  }
  if (msg.issuer() != sender) {
    return fail(module_error_code::unauthorized,
                "Invalid creator address, creator address must be the same as "
                "the sender");
  }
  if (!matches_denom_format(msg.subunit())) {
    return fail(module_error_code::invalid_request,
                "subunit must match regex format "
                "'^[a-zA-Z][a-zA-Z0-9/:._-]{2,127}$': invalid input");
  }
  if (!matches_denom_format(msg.symbol())) {
    return fail(module_error_code::invalid_request,
                "symbol must match regex format "
                "'^[a-zA-Z][a-zA-Z0-9/:._-]{2,127}$': invalid input");
  }

  auto denom = make_ft_denom(msg.subunit(), msg.issuer());
  if (auto failure = require_zero_supply(store, router, denom, codespace)) {
    return std::move(*failure);
  }
  if (auto failure = charge_creation_fee(
          store, router, block, sender, params.denom_creation_fee,
          cwsim::schema::denom_grammar::coreum, codespace)) {
    return std::move(*failure);
  }

  auto initial_amount = cwsim::schema::amount_t{0};
  if (!msg.initial_amount().empty()) {
    auto parsed = cwsim::schema::try_parse_amount(msg.initial_amount());
    if (!parsed) {
      return fail(module_error_code::invalid_request,
                  fmt::format("invalid initial_amount `{}`: not an unsigned "
                              "128-bit integer",
                              msg.initial_amount()));
    }
    initial_amount = *parsed;
  }

  save_issued_token(store, denom, msg);
  spdlog::debug("Issued Coreum FT '{}'", denom);

  if (initial_amount != 0) {
    auto coin = cwsim::schema::coin_t{.denom = denom, .amount = initial_amount};
    auto minted = router.sudo(
        store, block,
        cwsim::ledger::bank_mint{.to_address = msg.issuer(), .amount = {coin}});
    if (!minted.ok()) {
      return minted;
    }
  }

  auto event = cwsim::schema::make_event("/coreum.asset.ft.v1.EventIssued");
  event.add_attribute("denom", denom).add_attribute("issuer", msg.issuer());
  return respond({std::move(event)});
}

struct checked_coin final {
  cwsim::schema::coin_t coin;
  std::optional<app_result_t> error;
};

// Coin presence, denom shape and issuer identity shared by FT mint and burn.
checked_coin check_issuer_coin(const cwsim::ledger::store_t& store,
                               const bool has_coin,
                               const ::cosmos::base::v1beta1::Coin& proto,
                               const std::string_view sender,
                               const std::string_view msg_sender,
                               const std::string_view action,
                               const std::string_view message_name) {
  if (!has_coin) {
    return {.error = fail(module_error_code::invalid_request,
                          fmt::format("{}.coin is None", message_name))};
  }
  auto parts = split(proto.denom(), '-');
  if (parts.size() != 2) {
    return {.error = fail(module_error_code::invalid_request, "Invalid denom")};
  }
  if (parts[1] != sender) {
    return {.error = fail(
                module_error_code::unauthorized,
                fmt::format("Unauthorized {}. Not the issuer of the denom.",
                            action))};
  }
  if (sender != msg_sender) {
    return {.error = fail(module_error_code::unauthorized,
                          "Invalid sender. Sender in msg must be same as "
                          "sender of transaction.")};
  }
  if (!load_issued_token(store, proto.denom())) {
    return {.error = fail(module_error_code::not_found,
                          fmt::format("{} for unknown Coreum FT denom `{}`",
                                      message_name, proto.denom()))};
  }
  auto coin = cwsim::schema::encoding::from_proto(proto);
  if (!coin) {
    return {.error = fail(module_error_code::invalid_request,
                          fmt::format("Invalid amount `{}`", proto.amount()))};
  }
  if (coin->amount == 0) {
    return {.error = fail(module_error_code::invalid_request,
                          "Invalid zero amount")};
  }
  return {.coin = std::move(*coin)};
}

app_result_t mint(cwsim::ledger::store_t& store,
                  cwsim::ledger::router& router,
                  const cwsim::schema::block_info_t& block,
                  const std::string_view sender,
                  const ft_v1::MsgMint& msg) {
  auto [coin, error] = check_issuer_coin(store, msg.has_coin(), msg.coin(),
                                         sender, msg.sender(), "mint",
                                         "MsgMint");
  if (error) {
    return std::move(*error);
  }

  auto recipient = msg.recipient().empty() ? msg.sender() : msg.recipient();
  auto minted = router.sudo(
      store, block,
      cwsim::ledger::bank_mint{.to_address = recipient, .amount = {coin}});
  if (!minted.ok()) {
    return minted;
  }
  spdlog::debug("Minted {} to '{}'", cwsim::schema::to_string(coin), recipient);

  auto event = cwsim::schema::make_event("tf_mint");
  event.add_attribute("sender", msg.sender())
      .add_attribute("recipient", recipient)
      .add_attribute("denom", coin.denom)
      .add_attribute("amount", cwsim::schema::to_string(coin.amount));
  return respond({std::move(event)});
}

app_result_t burn(cwsim::ledger::store_t& store,
                  cwsim::ledger::router& router,
                  const cwsim::schema::block_info_t& block,
                  const std::string_view sender,
                  const ft_v1::MsgBurn& msg) {
  auto [coin, error] = check_issuer_coin(store, msg.has_coin(), msg.coin(),
                                         sender, msg.sender(), "burn",
                                         "MsgBurn");
  if (error) {
    return std::move(*error);
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
  return respond({std::move(event)});
}

app_result_t issue_class(cwsim::ledger::store_t& store,
                         const std::string_view sender,
                         const nft_v1::MsgIssueClass& msg) {
  if (msg.issuer() != sender) {
    return fail(module_error_code::unauthorized,
                "Invalid issuer. issuer in msg must match sender.");
  }
  auto class_id = make_class_id(msg.symbol(), msg.issuer());
  if (load_class(store, class_id)) {
    return fail(module_error_code::already_exists,
                fmt::format("NFT class already exists: {}", class_id));
  }

  save_class(store, class_id, msg);
  spdlog::debug("Issued NFT class '{}'", class_id);

  auto event =
      cwsim::schema::make_event("/coreum.asset.nft.v1.EventClassIssued");
  event.add_attribute("class_id", class_id)
      .add_attribute("issuer", msg.issuer());
  return respond({std::move(event)});
}

app_result_t nft_mint(cwsim::ledger::store_t& store,
                      const std::string_view sender,
                      const nft_v1::MsgMint& msg) {
  if (msg.sender() != sender) {
    return fail(module_error_code::unauthorized,
                "Invalid sender. sender in msg must match tx sender.");
  }
  auto issued = load_class(store, msg.class_id());
  if (!issued) {
    return fail(module_error_code::not_found,
                fmt::format("MsgMint for unknown Coreum NFT class `{}`",
                            msg.class_id()));
  }
  if (issued->issuer() != sender) {
    return fail(module_error_code::unauthorized,
                fmt::format("Unauthorized mint. Not the issuer of class `{}`",
                            msg.class_id()));
  }
  if (load_nft(store, msg.class_id(), msg.id())) {
    return fail(module_error_code::already_exists,
                fmt::format("NFT already minted: {}/{}", msg.class_id(),
                            msg.id()));
  }

  auto owner = msg.recipient().empty() ? msg.sender() : msg.recipient();
  auto stored = cwsim::store::v1::StoredNft{};
  stored.set_class_id(msg.class_id());
  stored.set_id(msg.id());
  stored.set_owner(owner);
  stored.set_uri(msg.uri());
  stored.set_uri_hash(msg.uri_hash());
  if (msg.has_data()) {
    *stored.mutable_data() = msg.data();
  }
  save_nft(store, stored);
  spdlog::debug("Minted NFT {}/{} to '{}'", msg.class_id(), msg.id(), owner);

  auto event = cwsim::schema::make_event("/coreum.asset.nft.v1.EventMinted");
  event.add_attribute("class_id", msg.class_id())
      .add_attribute("id", msg.id())
      .add_attribute("owner", owner);
  return respond({std::move(event)});
}

app_result_t nft_burn(cwsim::ledger::store_t& store,
                      const std::string_view sender,
                      const nft_v1::MsgBurn& msg) {
  if (msg.sender() != sender) {
    return fail(module_error_code::unauthorized,
                "Invalid sender. sender in msg must match tx sender.");
  }
  auto issued = load_class(store, msg.class_id());
  if (!issued) {
    return fail(module_error_code::not_found,
                fmt::format("Class id not found: {}", msg.class_id()));
  }
  auto stored = load_nft(store, msg.class_id(), msg.id());
  if (!stored) {
    return fail(module_error_code::not_found,
                fmt::format("NFT not found: {}/{}", msg.class_id(), msg.id()));
  }

  auto issuer_may_burn = has_feature(*issued, nft_v1::burning);
  if (stored->owner() != sender &&
      !(issuer_may_burn && issued->issuer() == sender)) {
    return fail(module_error_code::unauthorized,
                fmt::format("Unauthorized burn. Only owner or issuer can burn "
                            "{}/{}",
                            msg.class_id(), msg.id()));
  }

  remove_nft(store, msg.class_id(), msg.id());
  spdlog::debug("Burned NFT {}/{}", msg.class_id(), msg.id());

  auto event = cwsim::schema::make_event("/coreum.asset.nft.v1.EventBurned");
  event.add_attribute("class_id", msg.class_id())
      .add_attribute("id", msg.id())
      .add_attribute("owner", std::string{sender});
  return respond({std::move(event)});
}

app_result_t nft_send(cwsim::ledger::store_t& store,
                      const std::string_view sender,
                      const cosmos_nft::MsgSend& msg) {
  auto issued = load_class(store, msg.class_id());
  if (!issued) {
    return fail(module_error_code::not_found,
                fmt::format("Class id not found: {}", msg.class_id()));
  }
  auto stored = load_nft(store, msg.class_id(), msg.id());
  if (!stored) {
    return fail(module_error_code::not_found,
                fmt::format("NFT not found: {}/{}", msg.class_id(), msg.id()));
  }

  // A soulbound NFT moves only at the class issuer's hand.
  auto issuer_override = has_feature(*issued, nft_v1::soulbound) &&
                         issued->issuer() == sender;
  if (msg.sender() != sender && !issuer_override) {
    return fail(module_error_code::unauthorized,
                "Invalid sender. sender in msg must match tx sender.");
  }
  if (has_feature(*issued, nft_v1::soulbound) && !issuer_override) {
    return fail(module_error_code::unauthorized,
                fmt::format("Unauthorized send. Only issuer can send "
                            "soulbound {}/{}",
                            msg.class_id(), msg.id()));
  }
  if (stored->owner() != sender && !issuer_override) {
    return fail(module_error_code::unauthorized,
                fmt::format("Unauthorized send. Only owner can send {}/{}",
                            msg.class_id(), msg.id()));
  }
  if (msg.receiver().empty()) {
    return fail(module_error_code::invalid_request,
                "MsgSend.receiver is empty");
  }

  stored->set_owner(msg.receiver());
  save_nft(store, *stored);
  spdlog::debug("Sent NFT {}/{} to '{}'", msg.class_id(), msg.id(),
                msg.receiver());

  auto event = cwsim::schema::make_event("/coreum.asset.nft.v1.EventSent");
  event.add_attribute("class_id", msg.class_id())
      .add_attribute("id", msg.id())
      .add_attribute("sender", msg.sender())
      .add_attribute("receiver", msg.receiver());
  return cwsim::schema::make_success_result(
      encode_payload(cosmos_nft::MsgSendResponse{}), {std::move(event)});
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

template <typename Request, typename Handler>
query_result_t decode_and_answer(const cwsim::schema::stargate_query_t& request,
                                 Handler&& handler) {
  auto error = std::string{};
  auto decoded = decode_payload<Request>(request.data, error);
  if (!decoded) {
    return cwsim::schema::make_query_error(module_error_code::decode_failed,
                                           std::move(error), codespace);
  }
  return handler(*decoded);
}

std::optional<std::string> non_empty(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

token_factory_params default_params() {
  return token_factory_params{
      .denom_prefix = "",
      .max_subdenom_length = 32,
      .max_creator_length = 75,
      .denom_creation_fee = "10000000ucore",
  };
}

token_factory::token_factory(token_factory_params params)
    : params_{std::move(params)} {}

app_result_t token_factory::execute(cwsim::ledger::store_t& store,
                                    cwsim::ledger::router& router,
                                    const cwsim::schema::block_info_t& block,
                                    const std::string_view sender,
                                    const cwsim::schema::stargate_msg_t& msg) {
  auto kind = cwsim::schema::from_string(msg.type_url, kCoreumMessages);
  if (!kind) {
    return fail(module_error_code::unsupported,
                fmt::format("Unknown message type {}", msg.type_url));
  }
  switch (*kind) {
    case coreum_message::issue:
      return decode_and_run<ft_v1::MsgIssue>(msg, [&](const auto& decoded) {
        return issue(params_, store, router, block, sender, decoded);
      });
    case coreum_message::mint:
      return decode_and_run<ft_v1::MsgMint>(msg, [&](const auto& decoded) {
        return mint(store, router, block, sender, decoded);
      });
    case coreum_message::burn:
      return decode_and_run<ft_v1::MsgBurn>(msg, [&](const auto& decoded) {
        return burn(store, router, block, sender, decoded);
      });
    case coreum_message::issue_class:
      return decode_and_run<nft_v1::MsgIssueClass>(
          msg, [&](const auto& decoded) {
            return issue_class(store, sender, decoded);
          });
    case coreum_message::nft_mint:
      return decode_and_run<nft_v1::MsgMint>(msg, [&](const auto& decoded) {
        return nft_mint(store, sender, decoded);
      });
    case coreum_message::nft_burn:
      return decode_and_run<nft_v1::MsgBurn>(msg, [&](const auto& decoded) {
        return nft_burn(store, sender, decoded);
      });
    case coreum_message::nft_send:
      return decode_and_run<cosmos_nft::MsgSend>(msg, [&](const auto& decoded) {
        return nft_send(store, sender, decoded);
      });
  }
  cwsim::common::critical("unhandled Coreum message");
}

query_result_t token_factory::query(
    const cwsim::ledger::store_t& store,
    const cwsim::ledger::querier&,
    const cwsim::schema::block_info_t& block,
    const cwsim::schema::stargate_query_t& request) const {
  auto kind = cwsim::schema::from_string(request.path, kCoreumQueries);
  if (!kind) {
    return cwsim::schema::make_query_error(
        module_error_code::unsupported,
        fmt::format("Unsupported query type: {}", request.path), codespace);
  }

  auto result = [&]() -> query_result_t {
    switch (*kind) {
      case coreum_query::token:
        return decode_and_answer<ft_v1::QueryTokenRequest>(
            request,
            [&](const auto& decoded) { return query_token(store, decoded.denom()); });
      case coreum_query::tokens:
        return decode_and_answer<ft_v1::QueryTokensRequest>(
            request, [&](const auto& decoded) {
              return query_tokens(store, decoded.issuer());
            });
      case coreum_query::class_:
        return decode_and_answer<nft_v1::QueryClassRequest>(
            request,
            [&](const auto& decoded) { return query_class(store, decoded.id()); });
      case coreum_query::classes:
        return decode_and_answer<nft_v1::QueryClassesRequest>(
            request, [&](const auto& decoded) {
              return query_classes(store, decoded.issuer());
            });
      case coreum_query::nft:
        return decode_and_answer<cosmos_nft::QueryNFTRequest>(
            request, [&](const auto& decoded) {
              return query_nft(store, decoded.class_id(), decoded.id());
            });
      case coreum_query::nfts:
        return decode_and_answer<cosmos_nft::QueryNFTsRequest>(
            request, [&](const auto& decoded) {
              return query_nfts(store, non_empty(decoded.class_id()),
                                non_empty(decoded.owner()));
            });
      case coreum_query::owner:
        return decode_and_answer<cosmos_nft::QueryOwnerRequest>(
            request, [&](const auto& decoded) {
              return query_owner(store, decoded.class_id(), decoded.id());
            });
    }
    cwsim::common::critical("unhandled Coreum query path");
  }();
  result.height = static_cast<int64_t>(block.height);
  return result;
}

app_result_t token_factory::sudo(cwsim::ledger::store_t&,
                                 cwsim::ledger::router&,
                                 const cwsim::schema::block_info_t&,
                                 const cwsim::schema::empty_t&) {
  return cwsim::schema::make_success_result();
}

}  // namespace cwsim::modules::coreum
