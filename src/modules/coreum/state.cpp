#include <spdlog/fmt/fmt.h>
#include <cwsim/modules/coreum/state.hpp>
#include <cwsim/schema/key/builder.hpp>

#include <algorithm>
#include <cctype>

namespace cwsim::modules::coreum {

namespace {

namespace ft_v1 = ::coreum::asset::ft::v1;
namespace nft_v1 = ::coreum::asset::nft::v1;
using cwsim::store::v1::StoredNft;

constexpr auto kIssuedTokens = std::string_view{"coreum_assetft/issued|"};
constexpr auto kIssuedClasses =
    std::string_view{"coreum_assetnft/issued_classes|"};
constexpr auto kMintedNfts = std::string_view{"coreum_assetnft/minted|"};

cwsim::schema::bytes_t make_token_key(const std::string_view denom) {
  auto key = cwsim::schema::key::builder{};
  key.write(kIssuedTokens).segment(denom);
  return key.data;
}

cwsim::schema::bytes_t make_class_key(const std::string_view class_id) {
  auto key = cwsim::schema::key::builder{};
  key.write(kIssuedClasses).segment(class_id);
  return key.data;
}

cwsim::schema::bytes_t make_nft_key(const std::string_view class_id,
                                    const std::string_view id) {
  auto key = cwsim::schema::key::builder{};
  key.write(kMintedNfts).segment(class_id).segment(id);
  return key.data;
}

template <typename T>
std::optional<T> load(const cwsim::ledger::store_t& store,
                      const cwsim::schema::bytes_t& key) {
  auto encoder = cwsim::ledger::encoder_t{};
  return store.get<T>(encoder, cwsim::schema::make_bytes_view(key));
}

template <typename T>
void save(cwsim::ledger::store_t& store,
          const cwsim::schema::bytes_t& key,
          const T& value) {
  auto encoder = cwsim::ledger::encoder_t{};
  store.put(encoder, cwsim::schema::make_bytes_view(key), value);
}

}  // namespace

std::string make_ft_denom(const std::string_view subunit,
                          const std::string_view issuer) {
  return fmt::format("{}-{}", subunit, issuer);
}

std::string make_class_id(const std::string_view symbol,
                          const std::string_view issuer) {
  auto lowered = std::string{symbol};
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return fmt::format("{}-{}", lowered, issuer);
}

std::optional<ft_v1::MsgIssue> load_issued_token(
    const cwsim::ledger::store_t& store,
    const std::string_view denom) {
  return load<ft_v1::MsgIssue>(store, make_token_key(denom));
}

std::vector<issued_token> list_issued_tokens(
    const cwsim::ledger::store_t& store) {
  auto encoder = cwsim::ledger::encoder_t{};
  auto out = std::vector<issued_token>{};
  for (const auto& [key, value] :
       store.list_by_prefix(cwsim::schema::make_bytes_view(kIssuedTokens))) {
    auto issue =
        encoder.decode<ft_v1::MsgIssue>(cwsim::schema::make_bytes_view(value));
    auto denom = make_ft_denom(issue.subunit(), issue.issuer());
    out.push_back(issued_token{.denom = std::move(denom),
                               .issue = std::move(issue)});
  }
  return out;
}

void save_issued_token(cwsim::ledger::store_t& store,
                       const std::string_view denom,
                       const ft_v1::MsgIssue& issue) {
  save(store, make_token_key(denom), issue);
}

std::optional<nft_v1::MsgIssueClass> load_class(
    const cwsim::ledger::store_t& store,
    const std::string_view class_id) {
  return load<nft_v1::MsgIssueClass>(store, make_class_key(class_id));
}

std::vector<issued_class> list_classes(const cwsim::ledger::store_t& store) {
  auto encoder = cwsim::ledger::encoder_t{};
  auto out = std::vector<issued_class>{};
  for (const auto& [key, value] :
       store.list_by_prefix(cwsim::schema::make_bytes_view(kIssuedClasses))) {
    auto issue = encoder.decode<nft_v1::MsgIssueClass>(
        cwsim::schema::make_bytes_view(value));
    auto id = make_class_id(issue.symbol(), issue.issuer());
    out.push_back(issued_class{.id = std::move(id), .issue = std::move(issue)});
  }
  return out;
}

void save_class(cwsim::ledger::store_t& store,
                const std::string_view class_id,
                const nft_v1::MsgIssueClass& issue) {
  save(store, make_class_key(class_id), issue);
}

bool has_feature(const nft_v1::MsgIssueClass& issue,
                 const nft_v1::ClassFeature feature) {
  const auto& features = issue.features();
  return std::any_of(features.begin(), features.end(), [feature](int value) {
    return value == static_cast<int>(feature);
  });
}

std::optional<StoredNft> load_nft(const cwsim::ledger::store_t& store,
                                  const std::string_view class_id,
                                  const std::string_view id) {
  return load<StoredNft>(store, make_nft_key(class_id, id));
}

std::vector<StoredNft> list_nfts(const cwsim::ledger::store_t& store,
                                 const std::optional<std::string>& class_id) {
  auto prefix = cwsim::schema::key::builder{};
  prefix.write(kMintedNfts);
  if (class_id) {
    prefix.segment(*class_id);
  }
  auto encoder = cwsim::ledger::encoder_t{};
  auto out = std::vector<StoredNft>{};
  for (const auto& [key, value] :
       store.list_by_prefix(cwsim::schema::make_bytes_view(prefix.data))) {
    out.push_back(
        encoder.decode<StoredNft>(cwsim::schema::make_bytes_view(value)));
  }
  return out;
}

void save_nft(cwsim::ledger::store_t& store, const StoredNft& nft) {
  save(store, make_nft_key(nft.class_id(), nft.id()), nft);
}

void remove_nft(cwsim::ledger::store_t& store,
                const std::string_view class_id,
                const std::string_view id) {
  auto key = make_nft_key(class_id, id);
  store.remove(cwsim::schema::make_bytes_view(key));
}

ft_v1::Token to_token(const std::string_view denom,
                      const ft_v1::MsgIssue& issue) {
  auto token = ft_v1::Token{};
  token.set_denom(std::string{denom});
  token.set_issuer(issue.issuer());
  token.set_symbol(issue.symbol());
  token.set_subunit(issue.subunit());
  token.set_precision(issue.precision());
  token.set_description(issue.description());
  token.set_burn_rate("0");
  token.set_send_commission_rate("0");
  return token;
}

ft_v1::Token make_native_token(const std::string_view denom) {
  auto token = ft_v1::Token{};
  token.set_denom(std::string{denom});
  token.set_symbol("CORE");
  token.set_subunit(std::string{denom});
  token.set_precision(6);
  token.set_description("Native Coreum token");
  token.set_burn_rate("0");
  token.set_send_commission_rate("0");
  return token;
}

nft_v1::Class to_class(const std::string_view class_id,
                       const nft_v1::MsgIssueClass& issue) {
  auto out = nft_v1::Class{};
  out.set_id(std::string{class_id});
  out.set_issuer(issue.issuer());
  out.set_name(issue.name());
  out.set_symbol(issue.symbol());
  out.set_description(issue.description());
  out.set_uri(issue.uri());
  out.set_uri_hash(issue.uri_hash());
  if (issue.has_data()) {
    *out.mutable_data() = issue.data();
  }
  *out.mutable_features() = issue.features();
  out.set_royalty_rate("0");
  return out;
}

::cosmos::nft::v1beta1::NFT to_nft(const StoredNft& stored) {
  auto out = ::cosmos::nft::v1beta1::NFT{};
  out.set_class_id(stored.class_id());
  out.set_id(stored.id());
  out.set_uri(stored.uri());
  out.set_uri_hash(stored.uri_hash());
  if (stored.has_data()) {
    *out.mutable_data() = stored.data();
  }
  return out;
}

}  // namespace cwsim::modules::coreum
