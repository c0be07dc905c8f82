#pragma once

#include <coreum/asset/ft/v1/token.pb.h>
#include <coreum/asset/ft/v1/tx.pb.h>
#include <coreum/asset/nft/v1/nft.pb.h>
#include <coreum/asset/nft/v1/tx.pb.h>
#include <cosmos/nft/v1beta1/nft.pb.h>
#include <cwsim/store/v1/records.pb.h>
#include <cwsim/ledger/types.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Records shared by the Coreum token factory (writer) and the Coreum query
// module (reader).
//
//   coreum_assetft/issued|<denom>                -> MsgIssue
//   coreum_assetnft/issued_classes|<class id>    -> MsgIssueClass
//   coreum_assetnft/minted|<class id>|<nft id>   -> StoredNft
namespace cwsim::modules::coreum {

inline constexpr auto native_denom = std::string_view{"ucore"};
inline constexpr auto codespace = std::string_view{"cwsim.coreum"};

struct issued_token final {
  std::string denom;
  ::coreum::asset::ft::v1::MsgIssue issue;
};

struct issued_class final {
  std::string id;
  ::coreum::asset::nft::v1::MsgIssueClass issue;
};

/// `<subunit>-<issuer>`
std::string make_ft_denom(std::string_view subunit, std::string_view issuer);

/// `lowercase(<symbol>)-<issuer>`
std::string make_class_id(std::string_view symbol, std::string_view issuer);

std::optional<::coreum::asset::ft::v1::MsgIssue> load_issued_token(
    const cwsim::ledger::store_t& store,
    std::string_view denom);
std::vector<issued_token> list_issued_tokens(
    const cwsim::ledger::store_t& store);
void save_issued_token(cwsim::ledger::store_t& store,
                       std::string_view denom,
                       const ::coreum::asset::ft::v1::MsgIssue& issue);

std::optional<::coreum::asset::nft::v1::MsgIssueClass> load_class(
    const cwsim::ledger::store_t& store,
    std::string_view class_id);
std::vector<issued_class> list_classes(const cwsim::ledger::store_t& store);
void save_class(cwsim::ledger::store_t& store,
                std::string_view class_id,
                const ::coreum::asset::nft::v1::MsgIssueClass& issue);
bool has_feature(const ::coreum::asset::nft::v1::MsgIssueClass& issue,
                 ::coreum::asset::nft::v1::ClassFeature feature);

std::optional<cwsim::store::v1::StoredNft> load_nft(
    const cwsim::ledger::store_t& store,
    std::string_view class_id,
    std::string_view id);
/// Live NFTs in key order, optionally limited to one class.
std::vector<cwsim::store::v1::StoredNft> list_nfts(
    const cwsim::ledger::store_t& store,
    const std::optional<std::string>& class_id);
void save_nft(cwsim::ledger::store_t& store,
              const cwsim::store::v1::StoredNft& nft);
void remove_nft(cwsim::ledger::store_t& store,
                std::string_view class_id,
                std::string_view id);

::coreum::asset::ft::v1::Token to_token(
    std::string_view denom,
    const ::coreum::asset::ft::v1::MsgIssue& issue);

/// Synthetic descriptor for the chain's fee denom, which is never issued.
::coreum::asset::ft::v1::Token make_native_token(std::string_view denom);

::coreum::asset::nft::v1::Class to_class(
    std::string_view class_id,
    const ::coreum::asset::nft::v1::MsgIssueClass& issue);

::cosmos::nft::v1beta1::NFT to_nft(const cwsim::store::v1::StoredNft& stored);

}  // namespace cwsim::modules::coreum
