#pragma once

#include <cosmos/base/query/v1beta1/pagination.pb.h>
#include <cwsim/modules/module.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cwsim::modules::coreum {

using page_request_t = ::cosmos::base::query::v1beta1::PageRequest;

// Typed Coreum custom queries, grouped the way the chain groups them.
namespace nft {

struct nft_request final {
  std::string class_id;
  std::string id;
};

struct nfts_request final {
  std::optional<std::string> class_id;
  std::optional<std::string> owner;
  std::optional<page_request_t> pagination;
};

struct owner_request final {
  std::string class_id;
  std::string id;
};

struct balance_request final {
  std::string class_id;
  std::string owner;
};

struct supply_request final {
  std::string class_id;
};

struct class_request final {
  std::string class_id;
};

using query_t = std::variant<nft_request,
                             nfts_request,
                             owner_request,
                             balance_request,
                             supply_request,
                             class_request>;

}  // namespace nft

namespace assetnft {

struct params_request final {};

struct class_request final {
  std::string id;
};

struct classes_request final {
  std::string issuer;
  std::optional<page_request_t> pagination;
};

struct frozen_request final {
  std::string id;
  std::string class_id;
};

struct whitelisted_request final {
  std::string id;
  std::string class_id;
  std::string account;
};

using query_t = std::variant<params_request,
                             class_request,
                             classes_request,
                             frozen_request,
                             whitelisted_request>;

}  // namespace assetnft

namespace assetft {

struct params_request final {};

struct token_request final {
  std::string denom;
};

struct tokens_request final {
  std::string issuer;
  std::optional<page_request_t> pagination;
};

struct balance_request final {
  std::string account;
  std::string denom;
};

struct frozen_balance_request final {
  std::string account;
  std::string denom;
};

using query_t = std::variant<params_request,
                             token_request,
                             tokens_request,
                             balance_request,
                             frozen_balance_request>;

}  // namespace assetft

using custom_query_t = std::variant<nft::query_t, assetnft::query_t, assetft::query_t>;

// Readers over the records the Coreum token factory writes. Each returns a
// protobuf-encoded response in `value`, or a not-found failure.
cwsim::schema::query_result_t query_nft(const cwsim::ledger::store_t& store,
                                        std::string_view class_id,
                                        std::string_view id);
/// Linear scan. The page response is always empty (no next key, total 0).
cwsim::schema::query_result_t query_nfts(
    const cwsim::ledger::store_t& store,
    const std::optional<std::string>& class_id,
    const std::optional<std::string>& owner);
cwsim::schema::query_result_t query_owner(const cwsim::ledger::store_t& store,
                                          std::string_view class_id,
                                          std::string_view id);
cwsim::schema::query_result_t query_class(const cwsim::ledger::store_t& store,
                                          std::string_view class_id);
/// An empty issuer lists every class.
cwsim::schema::query_result_t query_classes(
    const cwsim::ledger::store_t& store,
    std::string_view issuer);
/// Issued tokens first, then the native fee denom.
cwsim::schema::query_result_t query_token(const cwsim::ledger::store_t& store,
                                          std::string_view denom);
cwsim::schema::query_result_t query_tokens(
    const cwsim::ledger::store_t& store,
    std::string_view issuer);

/// Answers `custom_query_t` from the Coreum token factory's records. It has
/// no execute surface.
class query_module final
    : public module<cwsim::schema::empty_t, custom_query_t, cwsim::schema::empty_t> {
 public:
  cwsim::schema::app_result_t execute(
      cwsim::ledger::store_t& store,
      cwsim::ledger::router& router,
      const cwsim::schema::block_info_t& block,
      std::string_view sender,
      const cwsim::schema::empty_t& msg) override;

  cwsim::schema::query_result_t query(
      const cwsim::ledger::store_t& store,
      const cwsim::ledger::querier& querier,
      const cwsim::schema::block_info_t& block,
      const custom_query_t& request) const override;

  cwsim::schema::app_result_t sudo(cwsim::ledger::store_t& store,
                                   cwsim::ledger::router& router,
                                   const cwsim::schema::block_info_t& block,
                                   const cwsim::schema::empty_t& msg) override;
};

}  // namespace cwsim::modules::coreum
