#include <gtest/gtest.h>
#include <cwsim/schema/coin.hpp>

#include <string>
#include <vector>

namespace {

using cwsim::schema::denom_grammar;

}  // namespace

TEST(coin, parses_native_denom) {
  auto coin = cwsim::schema::try_parse_coin("10000000uosmo",
                                            denom_grammar::standard);
  ASSERT_TRUE(coin.has_value());
  EXPECT_EQ(coin->denom, "uosmo");
  EXPECT_EQ(coin->amount, cwsim::schema::amount_t{10000000});
}

TEST(coin, parses_ibc_and_factory_denoms) {
  auto ibc = std::string{"ibc/"} + std::string(64, 'A');
  auto coin = cwsim::schema::try_parse_coin("5" + ibc, denom_grammar::standard);
  ASSERT_TRUE(coin.has_value());
  EXPECT_EQ(coin->denom, ibc);

  auto factory = cwsim::schema::try_parse_coin("7factory/creator1/Sub2",
                                               denom_grammar::standard);
  ASSERT_TRUE(factory.has_value());
  EXPECT_EQ(factory->denom, "factory/creator1/Sub2");
  EXPECT_EQ(factory->amount, cwsim::schema::amount_t{7});
}

TEST(coin, rejects_malformed_denoms) {
  EXPECT_FALSE(
      cwsim::schema::try_parse_coin("10", denom_grammar::standard).has_value());
  EXPECT_FALSE(cwsim::schema::try_parse_coin("uosmo", denom_grammar::standard)
                   .has_value());
  EXPECT_FALSE(cwsim::schema::try_parse_coin("10 uosmo",
                                             denom_grammar::standard)
                   .has_value());
  EXPECT_FALSE(cwsim::schema::try_parse_coin("10ibc/abc",
                                             denom_grammar::standard)
                   .has_value());
  EXPECT_FALSE(cwsim::schema::try_parse_coin("10factory/Creator/sub",
                                             denom_grammar::standard)
                   .has_value());
}

TEST(coin, coreum_grammar_adds_subunit_issuer_shape) {
  EXPECT_FALSE(cwsim::schema::try_parse_coin("10utoken-issuer1",
                                             denom_grammar::standard)
                   .has_value());
  auto coin = cwsim::schema::try_parse_coin("10utoken-issuer1",
                                            denom_grammar::coreum);
  ASSERT_TRUE(coin.has_value());
  EXPECT_EQ(coin->denom, "utoken-issuer1");
  EXPECT_TRUE(
      cwsim::schema::is_valid_denom("ucore", denom_grammar::coreum));
  EXPECT_FALSE(
      cwsim::schema::is_valid_denom("UTOKEN-x", denom_grammar::coreum));
}

TEST(coin, renders_coin_lists) {
  auto coins = std::vector<cwsim::schema::coin_t>{
      {.denom = "uatom", .amount = 3}, {.denom = "ucore", .amount = 10}};
  EXPECT_EQ(cwsim::schema::to_string(coins), "3uatom,10ucore");
  EXPECT_EQ(cwsim::schema::to_string(std::vector<cwsim::schema::coin_t>{}), "");
}
