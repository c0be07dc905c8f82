#include <coreum/asset/ft/v1/query.pb.h>
#include <coreum/asset/nft/v1/query.pb.h>
#include <cosmos/nft/v1beta1/query.pb.h>
#include <spdlog/fmt/fmt.h>
#include <cwsim/modules/codec.hpp>
#include <cwsim/modules/coreum/query_module.hpp>
#include <cwsim/modules/coreum/state.hpp>
#include <cwsim/schema/results.hpp>

namespace cwsim::modules::coreum {

namespace {

namespace ft_v1 = ::coreum::asset::ft::v1;
namespace nft_v1 = ::coreum::asset::nft::v1;
namespace cosmos_nft = ::cosmos::nft::v1beta1;
using cwsim::schema::module_error_code;
using cwsim::schema::query_result_t;

query_result_t not_found(std::string log) {
  return cwsim::schema::make_query_error(module_error_code::not_found,
                                         std::move(log), codespace);
}

query_result_t not_implemented(const std::string_view category,
                               const std::string& shape) {
  return cwsim::schema::make_query_error(
      module_error_code::unsupported,
      fmt::format("Coreum {} query not implemented: {}", category, shape),
      codespace);
}

std::string describe(const nft::balance_request& request) {
  return fmt::format("Balance {{ class_id: \"{}\", owner: \"{}\" }}",
                     request.class_id, request.owner);
}

std::string describe(const nft::supply_request& request) {
  return fmt::format("Supply {{ class_id: \"{}\" }}", request.class_id);
}

std::string describe(const nft::class_request& request) {
  return fmt::format("Class {{ class_id: \"{}\" }}", request.class_id);
}

std::string describe(const assetnft::params_request&) { return "Params"; }

std::string describe(const assetnft::frozen_request& request) {
  return fmt::format("Frozen {{ id: \"{}\", class_id: \"{}\" }}", request.id,
                     request.class_id);
}

std::string describe(const assetnft::whitelisted_request& request) {
  return fmt::format(
      "Whitelisted {{ id: \"{}\", class_id: \"{}\", account: \"{}\" }}",
      request.id, request.class_id, request.account);
}

std::string describe(const assetft::params_request&) { return "Params"; }

std::string describe(const assetft::balance_request& request) {
  return fmt::format("Balance {{ account: \"{}\", denom: \"{}\" }}",
                     request.account, request.denom);
}

std::string describe(const assetft::frozen_balance_request& request) {
  return fmt::format("FrozenBalance {{ account: \"{}\", denom: \"{}\" }}",
                     request.account, request.denom);
}

query_result_t run(const cwsim::ledger::store_t& store,
                   const nft::query_t& request) {
  return std::visit(
      overloaded{
          [&](const nft::nft_request& r) {
            return query_nft(store, r.class_id, r.id);
          },
          [&](const nft::nfts_request& r) {
            return query_nfts(store, r.class_id, r.owner);
          },
          [&](const nft::owner_request& r) {
            return query_owner(store, r.class_id, r.id);
          },
          [&](const auto& r) { return not_implemented("NFT", describe(r)); },
      },
      request);
}

query_result_t run(const cwsim::ledger::store_t& store,
                   const assetnft::query_t& request) {
  return std::visit(
      overloaded{
          [&](const assetnft::class_request& r) {
            return query_class(store, r.id);
          },
          [&](const assetnft::classes_request& r) {
            return query_classes(store, r.issuer);
          },
          [&](const auto& r) {
            return not_implemented("AssetNFT", describe(r));
          },
      },
      request);
}

query_result_t run(const cwsim::ledger::store_t& store,
                   const assetft::query_t& request) {
  return std::visit(
      overloaded{
          [&](const assetft::token_request& r) {
            return query_token(store, r.denom);
          },
          [&](const assetft::tokens_request& r) {
            return query_tokens(store, r.issuer);
          },
          [&](const auto& r) {
            return not_implemented("AssetFT", describe(r));
          },
      },
      request);
}

}  // namespace

query_result_t query_nft(const cwsim::ledger::store_t& store,
                         const std::string_view class_id,
                         const std::string_view id) {
  auto stored = load_nft(store, class_id, id);
  if (!stored) {
    return not_found(fmt::format("NFT not found for {}/{}", class_id, id));
  }
  auto response = cosmos_nft::QueryNFTResponse{};
  *response.mutable_nft() = to_nft(*stored);
  return cwsim::schema::make_query_success(encode_payload(response));
}

query_result_t query_nfts(const cwsim::ledger::store_t& store,
                          const std::optional<std::string>& class_id,
                          const std::optional<std::string>& owner) {
  auto response = cosmos_nft::QueryNFTsResponse{};
  for (const auto& stored : list_nfts(store, class_id)) {
    if (owner && stored.owner() != *owner) {
      continue;
    }
    *response.add_nfts() = to_nft(stored);
  }
  response.mutable_pagination()->set_total(0);
  return cwsim::schema::make_query_success(encode_payload(response));
}

query_result_t query_owner(const cwsim::ledger::store_t& store,
                           const std::string_view class_id,
                           const std::string_view id) {
  auto stored = load_nft(store, class_id, id);
  if (!stored) {
    return not_found(fmt::format("NFT not found for {}/{}", class_id, id));
  }
  auto response = cosmos_nft::QueryOwnerResponse{};
  response.set_owner(stored->owner());
  return cwsim::schema::make_query_success(encode_payload(response));
}

query_result_t query_class(const cwsim::ledger::store_t& store,
                           const std::string_view class_id) {
  auto issue = load_class(store, class_id);
  if (!issue) {
    return not_found(
        fmt::format("NFT class not found for id `{}`", class_id));
  }
  auto response = nft_v1::QueryClassResponse{};
  *response.mutable_class_() = to_class(class_id, *issue);
  return cwsim::schema::make_query_success(encode_payload(response));
}

query_result_t query_classes(const cwsim::ledger::store_t& store,
                             const std::string_view issuer) {
  auto response = nft_v1::QueryClassesResponse{};
  for (const auto& entry : list_classes(store)) {
    if (!issuer.empty() && entry.issue.issuer() != issuer) {
      continue;
    }
    *response.add_classes() = to_class(entry.id, entry.issue);
  }
  response.mutable_pagination()->set_total(0);
  return cwsim::schema::make_query_success(encode_payload(response));
}

query_result_t query_token(const cwsim::ledger::store_t& store,
                           const std::string_view denom) {
  auto response = ft_v1::QueryTokenResponse{};
  if (auto issue = load_issued_token(store, denom)) {
    *response.mutable_token() = to_token(denom, *issue);
  } else if (denom == native_denom) {
    *response.mutable_token() = make_native_token(denom);
  } else {
    return not_found(fmt::format("FT not found for denom `{}`", denom));
  }
  return cwsim::schema::make_query_success(encode_payload(response));
}

query_result_t query_tokens(const cwsim::ledger::store_t& store,
                            const std::string_view issuer) {
  auto response = ft_v1::QueryTokensResponse{};
  for (const auto& entry : list_issued_tokens(store)) {
    if (!issuer.empty() && entry.issue.issuer() != issuer) {
      continue;
    }
    *response.add_tokens() = to_token(entry.denom, entry.issue);
  }
  response.mutable_pagination()->set_total(0);
  return cwsim::schema::make_query_success(encode_payload(response));
}

cwsim::schema::app_result_t query_module::execute(
    cwsim::ledger::store_t&,
    cwsim::ledger::router&,
    const cwsim::schema::block_info_t&,
    std::string_view,
    const cwsim::schema::empty_t&) {
  return cwsim::schema::make_error_result(
      module_error_code::unsupported,
      "Coreum query module execute is not implemented", codespace);
}

query_result_t query_module::query(const cwsim::ledger::store_t& store,
                                   const cwsim::ledger::querier&,
                                   const cwsim::schema::block_info_t& block,
                                   const custom_query_t& request) const {
  auto result = std::visit(
      [&](const auto& category) { return run(store, category); }, request);
  result.height = static_cast<int64_t>(block.height);
  return result;
}

cwsim::schema::app_result_t query_module::sudo(
    cwsim::ledger::store_t&,
    cwsim::ledger::router&,
    const cwsim::schema::block_info_t&,
    const cwsim::schema::empty_t&) {
  return cwsim::schema::make_success_result();
}

}  // namespace cwsim::modules::coreum
