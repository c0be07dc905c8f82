#include <gtest/gtest.h>
#include <coreum/asset/ft/v1/tx.pb.h>
#include <coreum/asset/nft/v1/tx.pb.h>
#include <cosmos/bank/v1beta1/query.pb.h>
#include <cosmos/nft/v1beta1/query.pb.h>
#include <cosmos/nft/v1beta1/tx.pb.h>
#include <osmosis/tokenfactory/v1beta1/tx.pb.h>
#include <cwsim/ledger/types.hpp>
#include <cwsim/schema/primitives.hpp>
#include <cwsim/testing/common.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef CWSIM_ENVELOPE_BUILDER_PATH
#define CWSIM_ENVELOPE_BUILDER_PATH ""
#endif

namespace {

using cwsim::testing::make_proto_coin;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder, const std::string_view args) {
  auto command = shell_quote(builder) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

template <typename T>
std::string expected_base64(const T& message) {
  return cwsim::schema::to_base64(cwsim::ledger::encoder_t{}.encode(message));
}

template <typename T>
std::string expected_hex(const T& message) {
  auto bytes = cwsim::ledger::encoder_t{}.encode(message);
  return cwsim::schema::to_hex(cwsim::schema::make_bytes_view(bytes));
}

std::string builder_path() { return std::string{CWSIM_ENVELOPE_BUILDER_PATH}; }

bool builder_available(const std::string& builder) {
  return !builder.empty() && std::filesystem::exists(builder);
}

}  // namespace

TEST(envelope_builder, token_factory_messages_match_local_encoding) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "envelope_builder binary not available: " << builder;
  }

  auto create = osmosis::tokenfactory::v1beta1::MsgCreateDenom{};
  create.set_sender("creator");
  create.set_subdenom("mytoken");
  EXPECT_EQ(run_builder(builder,
                        "message --type create-denom --sender creator "
                        "--subdenom mytoken"),
            expected_base64(create));

  auto mint = osmosis::tokenfactory::v1beta1::MsgMint{};
  mint.set_sender("creator");
  *mint.mutable_amount() = make_proto_coin(250, "factory/creator/mytoken");
  mint.set_minttoaddress("bob");
  EXPECT_EQ(run_builder(builder,
                        "message --type tf-mint --sender creator "
                        "--coin 250factory/creator/mytoken --recipient bob "
                        "--format hex"),
            expected_hex(mint));
}

TEST(envelope_builder, coreum_messages_match_local_encoding) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "envelope_builder binary not available: " << builder;
  }

  auto issue = coreum::asset::ft::v1::MsgIssue{};
  issue.set_issuer("issuer1");
  issue.set_symbol("TOKEN");
  issue.set_subunit("utoken");
  issue.set_precision(6);
  issue.set_initial_amount("1000");
  EXPECT_EQ(run_builder(builder,
                        "message --type ft-issue --sender issuer1 --symbol TOKEN "
                        "--subunit utoken --initial-amount 1000"),
            expected_base64(issue));

  auto ft_mint = coreum::asset::ft::v1::MsgMint{};
  ft_mint.set_sender("issuer1");
  *ft_mint.mutable_coin() = make_proto_coin(5, "utoken-issuer1");
  EXPECT_EQ(run_builder(builder,
                        "message --type ft-mint --sender issuer1 "
                        "--coin 5utoken-issuer1"),
            expected_base64(ft_mint));

  auto issue_class = coreum::asset::nft::v1::MsgIssueClass{};
  issue_class.set_issuer("sender");
  issue_class.set_symbol("NFTClass");
  issue_class.set_name("Test class");
  issue_class.add_features(coreum::asset::nft::v1::burning);
  issue_class.add_features(coreum::asset::nft::v1::soulbound);
  EXPECT_EQ(run_builder(builder,
                        "message --type nft-issue-class --sender sender "
                        "--symbol NFTClass --name 'Test class' "
                        "--feature burning soulbound"),
            expected_base64(issue_class));

  auto send = cosmos::nft::v1beta1::MsgSend{};
  send.set_class_id("nftclass-sender");
  send.set_id("nft1");
  send.set_sender("sender");
  send.set_receiver("receiver");
  EXPECT_EQ(run_builder(builder,
                        "message --type nft-send --sender sender "
                        "--class-id nftclass-sender --id nft1 "
                        "--recipient receiver"),
            expected_base64(send));
}

TEST(envelope_builder, query_requests_match_local_encoding) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "envelope_builder binary not available: " << builder;
  }

  auto balance = cosmos::bank::v1beta1::QueryBalanceRequest{};
  balance.set_address("alice");
  balance.set_denom("ucore");
  EXPECT_EQ(run_builder(builder,
                        "query --path balance --address alice --denom ucore"),
            expected_base64(balance));

  auto nfts = cosmos::nft::v1beta1::QueryNFTsRequest{};
  nfts.set_owner("receiver");
  EXPECT_EQ(run_builder(builder, "query --path nfts --owner receiver --format hex"),
            expected_hex(nfts));
}

TEST(envelope_builder, type_url_prints_routes) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "envelope_builder binary not available: " << builder;
  }

  EXPECT_EQ(run_builder(builder, "type-url create-denom"),
            "/osmosis.tokenfactory.v1beta1.MsgCreateDenom");
  EXPECT_EQ(run_builder(builder, "type-url nft-send"),
            "/cosmos.nft.v1beta1.MsgSend");
  EXPECT_EQ(run_builder(builder, "type-url ft-token"),
            "/coreum.asset.ft.v1.Query/Token");
  EXPECT_EQ(run_builder(builder, "type-url supply-of"),
            "/cosmos.bank.v1beta1.Query/SupplyOf");
}

TEST(envelope_builder, rejects_unknown_kinds_and_missing_arguments) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "envelope_builder binary not available: " << builder;
  }

  auto [unknown_code, unknown_output] =
      run_capture(shell_quote(builder) + " message --type freeze 2>&1");
  EXPECT_NE(unknown_code, 0) << unknown_output;

  auto [missing_code, missing_output] = run_capture(
      shell_quote(builder) + " message --type ft-burn --sender issuer1 2>&1");
  EXPECT_NE(missing_code, 0) << missing_output;

  auto [coin_code, coin_output] = run_capture(
      shell_quote(builder) +
      " message --type ft-mint --sender issuer1 --coin notacoin 2>&1");
  EXPECT_NE(coin_code, 0) << coin_output;
}
