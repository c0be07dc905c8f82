#include <coreum/asset/ft/v1/query.pb.h>
#include <coreum/asset/ft/v1/tx.pb.h>
#include <coreum/asset/nft/v1/query.pb.h>
#include <coreum/asset/nft/v1/tx.pb.h>
#include <cosmos/bank/v1beta1/query.pb.h>
#include <cosmos/nft/v1beta1/query.pb.h>
#include <cosmos/nft/v1beta1/tx.pb.h>
#include <cosmwasm/wasm/v1/query.pb.h>
#include <osmosis/tokenfactory/v1beta1/tx.pb.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <cwsim/common/critical.hpp>
#include <cwsim/ledger/types.hpp>
#include <cwsim/schema/coin.hpp>
#include <cwsim/schema/encoding/protobuf/coin.hpp>
#include <cwsim/schema/enum_string.hpp>

#include <array>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

namespace po = boost::program_options;
namespace tf = osmosis::tokenfactory::v1beta1;
namespace ft_v1 = coreum::asset::ft::v1;
namespace nft_v1 = coreum::asset::nft::v1;
namespace cosmos_nft = cosmos::nft::v1beta1;
namespace bank_v1 = cosmos::bank::v1beta1;
namespace wasm_v1 = cosmwasm::wasm::v1;
using cwsim::schema::encoding::type_url;

enum class message_kind : uint8_t {
  create_denom,
  tf_mint,
  tf_burn,
  ft_issue,
  ft_mint,
  ft_burn,
  nft_issue_class,
  nft_mint,
  nft_burn,
  nft_send,
};

constexpr auto kMessageKinds =
    std::array<std::pair<std::string_view, message_kind>, 10>{{
        {"create-denom", message_kind::create_denom},
        {"tf-mint", message_kind::tf_mint},
        {"tf-burn", message_kind::tf_burn},
        {"ft-issue", message_kind::ft_issue},
        {"ft-mint", message_kind::ft_mint},
        {"ft-burn", message_kind::ft_burn},
        {"nft-issue-class", message_kind::nft_issue_class},
        {"nft-mint", message_kind::nft_mint},
        {"nft-burn", message_kind::nft_burn},
        {"nft-send", message_kind::nft_send},
    }};

enum class query_kind : uint8_t {
  all_balances,
  balance,
  supply_of,
  smart_contract_state,
  contract_info,
  ft_token,
  ft_tokens,
  nft_class,
  nft_classes,
  nft,
  nfts,
  nft_owner,
};

constexpr auto kQueryKinds =
    std::array<std::pair<std::string_view, query_kind>, 12>{{
        {"all-balances", query_kind::all_balances},
        {"balance", query_kind::balance},
        {"supply-of", query_kind::supply_of},
        {"smart-contract-state", query_kind::smart_contract_state},
        {"contract-info", query_kind::contract_info},
        {"ft-token", query_kind::ft_token},
        {"ft-tokens", query_kind::ft_tokens},
        {"nft-class", query_kind::nft_class},
        {"nft-classes", query_kind::nft_classes},
        {"nft", query_kind::nft},
        {"nfts", query_kind::nfts},
        {"nft-owner", query_kind::nft_owner},
    }};

std::string message_type_url(const message_kind kind) {
  switch (kind) {
    case message_kind::create_denom:
      return type_url<tf::MsgCreateDenom>();
    case message_kind::tf_mint:
      return type_url<tf::MsgMint>();
    case message_kind::tf_burn:
      return type_url<tf::MsgBurn>();
    case message_kind::ft_issue:
      return type_url<ft_v1::MsgIssue>();
    case message_kind::ft_mint:
      return type_url<ft_v1::MsgMint>();
    case message_kind::ft_burn:
      return type_url<ft_v1::MsgBurn>();
    case message_kind::nft_issue_class:
      return type_url<nft_v1::MsgIssueClass>();
    case message_kind::nft_mint:
      return type_url<nft_v1::MsgMint>();
    case message_kind::nft_burn:
      return type_url<nft_v1::MsgBurn>();
    case message_kind::nft_send:
      return type_url<cosmos_nft::MsgSend>();
  }
  cwsim::common::critical("unhandled message kind");
}

std::string query_path(const query_kind kind) {
  switch (kind) {
    case query_kind::all_balances:
      return "/cosmos.bank.v1beta1.Query/AllBalances";
    case query_kind::balance:
      return "/cosmos.bank.v1beta1.Query/Balance";
    case query_kind::supply_of:
      return "/cosmos.bank.v1beta1.Query/SupplyOf";
    case query_kind::smart_contract_state:
      return "/cosmwasm.wasm.v1.Query/SmartContractState";
    case query_kind::contract_info:
      return "/cosmwasm.wasm.v1.Query/ContractInfo";
    case query_kind::ft_token:
      return "/coreum.asset.ft.v1.Query/Token";
    case query_kind::ft_tokens:
      return "/coreum.asset.ft.v1.Query/Tokens";
    case query_kind::nft_class:
      return "/coreum.asset.nft.v1.Query/Class";
    case query_kind::nft_classes:
      return "/coreum.asset.nft.v1.Query/Classes";
    case query_kind::nft:
      return "/cosmos.nft.v1beta1.Query/NFT";
    case query_kind::nfts:
      return "/cosmos.nft.v1beta1.Query/NFTs";
    case query_kind::nft_owner:
      return "/cosmos.nft.v1beta1.Query/Owner";
  }
  cwsim::common::critical("unhandled query kind");
}

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::string>();
}

std::string require_string(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    cwsim::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

cosmos::base::v1beta1::Coin get_coin(const po::variables_map& vm) {
  auto value = require_string(vm, "coin");
  auto coin =
      cwsim::schema::try_parse_coin(value, cwsim::schema::denom_grammar::coreum);
  if (!coin) {
    cwsim::common::critical("--coin must be <amount><denom>");
  }
  return cwsim::schema::encoding::to_proto(*coin);
}

nft_v1::ClassFeature parse_class_feature(const std::string& name) {
  static constexpr auto kFeatures =
      std::array<std::pair<std::string_view, nft_v1::ClassFeature>, 5>{{
          {"burning", nft_v1::burning},
          {"freezing", nft_v1::freezing},
          {"whitelisting", nft_v1::whitelisting},
          {"disable_sending", nft_v1::disable_sending},
          {"soulbound", nft_v1::soulbound},
      }};
  auto feature = cwsim::schema::from_string(name, kFeatures);
  if (!feature) {
    cwsim::common::critical("unsupported class feature");
  }
  return *feature;
}

template <typename T>
cwsim::schema::bytes_t encode(const T& message) {
  spdlog::debug("Encoding {}: {}", T::descriptor()->full_name(),
                message.ShortDebugString());
  return cwsim::ledger::encoder_t{}.encode(message);
}

cwsim::schema::bytes_t build_message(const message_kind kind,
                                     const po::variables_map& vm) {
  switch (kind) {
    case message_kind::create_denom: {
      auto msg = tf::MsgCreateDenom{};
      msg.set_sender(require_string(vm, "sender"));
      msg.set_subdenom(require_string(vm, "subdenom"));
      return encode(msg);
    }
    case message_kind::tf_mint: {
      auto msg = tf::MsgMint{};
      msg.set_sender(require_string(vm, "sender"));
      *msg.mutable_amount() = get_coin(vm);
      msg.set_minttoaddress(get_string(vm, "recipient"));
      return encode(msg);
    }
    case message_kind::tf_burn: {
      auto msg = tf::MsgBurn{};
      msg.set_sender(require_string(vm, "sender"));
      *msg.mutable_amount() = get_coin(vm);
      msg.set_burnfromaddress(get_string(vm, "owner"));
      return encode(msg);
    }
    case message_kind::ft_issue: {
      auto msg = ft_v1::MsgIssue{};
      msg.set_issuer(require_string(vm, "sender"));
      msg.set_symbol(require_string(vm, "symbol"));
      msg.set_subunit(require_string(vm, "subunit"));
      msg.set_precision(vm["precision"].as<uint32_t>());
      msg.set_initial_amount(get_string(vm, "initial-amount"));
      msg.set_description(get_string(vm, "description"));
      return encode(msg);
    }
    case message_kind::ft_mint: {
      auto msg = ft_v1::MsgMint{};
      msg.set_sender(require_string(vm, "sender"));
      *msg.mutable_coin() = get_coin(vm);
      msg.set_recipient(get_string(vm, "recipient"));
      return encode(msg);
    }
    case message_kind::ft_burn: {
      auto msg = ft_v1::MsgBurn{};
      msg.set_sender(require_string(vm, "sender"));
      *msg.mutable_coin() = get_coin(vm);
      return encode(msg);
    }
    case message_kind::nft_issue_class: {
      auto msg = nft_v1::MsgIssueClass{};
      msg.set_issuer(require_string(vm, "sender"));
      msg.set_symbol(require_string(vm, "symbol"));
      msg.set_name(get_string(vm, "name"));
      msg.set_description(get_string(vm, "description"));
      msg.set_uri(get_string(vm, "uri"));
      msg.set_uri_hash(get_string(vm, "uri-hash"));
      if (vm.contains("feature")) {
        for (const auto& name : vm["feature"].as<std::vector<std::string>>()) {
          msg.add_features(parse_class_feature(name));
        }
      }
      return encode(msg);
    }
    case message_kind::nft_mint: {
      auto msg = nft_v1::MsgMint{};
      msg.set_sender(require_string(vm, "sender"));
      msg.set_class_id(require_string(vm, "class-id"));
      msg.set_id(require_string(vm, "id"));
      msg.set_uri(get_string(vm, "uri"));
      msg.set_uri_hash(get_string(vm, "uri-hash"));
      msg.set_recipient(get_string(vm, "recipient"));
      return encode(msg);
    }
    case message_kind::nft_burn: {
      auto msg = nft_v1::MsgBurn{};
      msg.set_sender(require_string(vm, "sender"));
      msg.set_class_id(require_string(vm, "class-id"));
      msg.set_id(require_string(vm, "id"));
      return encode(msg);
    }
    case message_kind::nft_send: {
      auto msg = cosmos_nft::MsgSend{};
      msg.set_sender(require_string(vm, "sender"));
      msg.set_class_id(require_string(vm, "class-id"));
      msg.set_id(require_string(vm, "id"));
      msg.set_receiver(require_string(vm, "recipient"));
      return encode(msg);
    }
  }
  cwsim::common::critical("unhandled message kind");
}

cwsim::schema::bytes_t build_query(const query_kind kind,
                                   const po::variables_map& vm) {
  switch (kind) {
    case query_kind::all_balances: {
      auto request = bank_v1::QueryAllBalancesRequest{};
      request.set_address(require_string(vm, "address"));
      return encode(request);
    }
    case query_kind::balance: {
      auto request = bank_v1::QueryBalanceRequest{};
      request.set_address(require_string(vm, "address"));
      request.set_denom(require_string(vm, "denom"));
      return encode(request);
    }
    case query_kind::supply_of: {
      auto request = bank_v1::QuerySupplyOfRequest{};
      request.set_denom(require_string(vm, "denom"));
      return encode(request);
    }
    case query_kind::smart_contract_state: {
      auto request = wasm_v1::QuerySmartContractStateRequest{};
      request.set_address(require_string(vm, "address"));
      request.set_query_data(require_string(vm, "query-data"));
      return encode(request);
    }
    case query_kind::contract_info: {
      auto request = wasm_v1::QueryContractInfoRequest{};
      request.set_address(require_string(vm, "address"));
      return encode(request);
    }
    case query_kind::ft_token: {
      auto request = ft_v1::QueryTokenRequest{};
      request.set_denom(require_string(vm, "denom"));
      return encode(request);
    }
    case query_kind::ft_tokens: {
      auto request = ft_v1::QueryTokensRequest{};
      request.set_issuer(get_string(vm, "issuer"));
      return encode(request);
    }
    case query_kind::nft_class: {
      auto request = nft_v1::QueryClassRequest{};
      request.set_id(require_string(vm, "class-id"));
      return encode(request);
    }
    case query_kind::nft_classes: {
      auto request = nft_v1::QueryClassesRequest{};
      request.set_issuer(get_string(vm, "issuer"));
      return encode(request);
    }
    case query_kind::nft: {
      auto request = cosmos_nft::QueryNFTRequest{};
      request.set_class_id(require_string(vm, "class-id"));
      request.set_id(require_string(vm, "id"));
      return encode(request);
    }
    case query_kind::nfts: {
      auto request = cosmos_nft::QueryNFTsRequest{};
      request.set_class_id(get_string(vm, "class-id"));
      request.set_owner(get_string(vm, "owner"));
      return encode(request);
    }
    case query_kind::nft_owner: {
      auto request = cosmos_nft::QueryOwnerRequest{};
      request.set_class_id(require_string(vm, "class-id"));
      request.set_id(require_string(vm, "id"));
      return encode(request);
    }
  }
  cwsim::common::critical("unhandled query kind");
}

std::string render(const cwsim::schema::bytes_t& bytes,
                   const std::string& format) {
  auto view = cwsim::schema::make_bytes_view(bytes);
  if (format == "hex") {
    return cwsim::schema::to_hex(view);
  }
  if (format == "base64") {
    return cwsim::schema::to_base64(view);
  }
  cwsim::common::critical("--format must be base64|hex");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  envelope_builder message --type <kind> [options]\n"
            << "  envelope_builder query --path <kind> [options]\n"
            << "  envelope_builder type-url <kind>\n\n"
            << "Message kinds:";
  for (const auto& [name, kind] : kMessageKinds) {
    std::cout << ' ' << name;
  }
  std::cout << "\nQuery kinds:";
  for (const auto& [name, kind] : kQueryKinds) {
    std::cout << ' ' << name;
  }
  std::cout << "\n\n" << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto kind_name = std::string{};
  auto options = po::options_description{"envelope_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "message|query|type-url")(
      "kind", po::value<std::string>(&kind_name), "kind for type-url")(
      "type", po::value<std::string>(), "message kind")(
      "path", po::value<std::string>(), "query kind")(
      "format", po::value<std::string>()->default_value("base64"),
      "base64|hex")("sender", po::value<std::string>(),
                    "transaction sender and msg signer")(
      "recipient", po::value<std::string>(), "mint or send recipient")(
      "owner", po::value<std::string>(), "owner filter or burn-from address")(
      "address", po::value<std::string>(), "account or contract address")(
      "issuer", po::value<std::string>(), "issuer filter")(
      "denom", po::value<std::string>(), "denom")(
      "coin", po::value<std::string>(), "<amount><denom>")(
      "subdenom", po::value<std::string>(), "token factory subdenom")(
      "symbol", po::value<std::string>(), "token or class symbol")(
      "subunit", po::value<std::string>(), "Coreum FT subunit")(
      "precision", po::value<uint32_t>()->default_value(6), "FT precision")(
      "initial-amount", po::value<std::string>(), "FT initial amount")(
      "description", po::value<std::string>(), "description")(
      "name", po::value<std::string>(), "NFT class name")(
      "class-id", po::value<std::string>(), "NFT class id")(
      "id", po::value<std::string>(), "NFT id")(
      "uri", po::value<std::string>(), "uri")(
      "uri-hash", po::value<std::string>(), "uri hash")(
      "feature", po::value<std::vector<std::string>>()->multitoken(),
      "NFT class features")("query-data", po::value<std::string>(),
                            "raw smart query payload")(
      "verbose,v", "log encoded messages to stderr");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  positional.add("kind", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  auto logger = spdlog::stderr_color_mt("envelope_builder");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto format = vm["format"].as<std::string>();

  if (command == "message" || command == "msg") {
    auto kind = cwsim::schema::from_string(require_string(vm, "type"),
                                           kMessageKinds);
    if (!kind) {
      cwsim::common::critical("unsupported message kind");
    }
    std::cout << render(build_message(*kind, vm), format) << '\n';
    return 0;
  }

  if (command == "query") {
    auto kind =
        cwsim::schema::from_string(require_string(vm, "path"), kQueryKinds);
    if (!kind) {
      cwsim::common::critical("unsupported query kind");
    }
    std::cout << render(build_query(*kind, vm), format) << '\n';
    return 0;
  }

  if (command == "type-url") {
    if (auto kind = cwsim::schema::from_string(kind_name, kMessageKinds)) {
      std::cout << message_type_url(*kind) << '\n';
      return 0;
    }
    if (auto kind = cwsim::schema::from_string(kind_name, kQueryKinds)) {
      std::cout << query_path(*kind) << '\n';
      return 0;
    }
    cwsim::common::critical("unknown kind for type-url");
  }

  cwsim::common::critical("command must be message|query|type-url");
}
