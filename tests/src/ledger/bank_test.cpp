#include <gtest/gtest.h>
#include <cwsim/ledger/bank.hpp>
#include <cwsim/schema/module_error_code.hpp>
#include <cwsim/testing/common.hpp>

#include <limits>

namespace {

using cwsim::testing::make_coin;

}  // namespace

TEST(bank, init_balance_grows_supply) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  bank.init_balance(store, "alice", {make_coin(100, "ucore")});
  bank.init_balance(store, "bob", {make_coin(50, "ucore")});

  EXPECT_EQ(bank.balance(store, "alice", "ucore").amount, 100u);
  EXPECT_EQ(bank.supply(store, "ucore").amount, 150u);
  EXPECT_EQ(bank.balance(store, "carol", "ucore").amount, 0u);
  EXPECT_EQ(bank.balance(store, "carol", "ucore").denom, "ucore");
}

TEST(bank, mint_credits_recipient_and_emits_event) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  auto result = bank.mint(store, "alice", {make_coin(7, "utoken")});

  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(bank.balance(store, "alice", "utoken").amount, 7u);
  EXPECT_EQ(bank.supply(store, "utoken").amount, 7u);
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, "mint");
  EXPECT_EQ(result.events[0].attribute("recipient"), "alice");
  EXPECT_EQ(result.events[0].attribute("amount"), "7utoken");
}

TEST(bank, burn_short_balance_reports_cannot_sub) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  bank.init_balance(store, "alice", {make_coin(5, "ucore")});

  auto result = bank.burn(store, "alice", {make_coin(10, "ucore")});
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.code, static_cast<uint32_t>(
                             cwsim::schema::module_error_code::insufficient_funds));
  EXPECT_EQ(result.log, "Overflow: Cannot Sub with 5 and 10");
  EXPECT_EQ(bank.balance(store, "alice", "ucore").amount, 5u);
  EXPECT_EQ(bank.supply(store, "ucore").amount, 5u);
}

TEST(bank, burn_reduces_balance_and_supply) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  bank.init_balance(store, "alice", {make_coin(5, "ucore")});

  auto result = bank.burn(store, "alice", {make_coin(5, "ucore")});
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(bank.balance(store, "alice", "ucore").amount, 0u);
  EXPECT_EQ(bank.supply(store, "ucore").amount, 0u);
  EXPECT_TRUE(bank.all_balances(store, "alice").empty());
  EXPECT_EQ(result.events[0].attribute("burner"), "alice");
}

TEST(bank, send_moves_funds_without_touching_supply) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  bank.init_balance(store, "alice", {make_coin(10, "ucore")});

  auto result = bank.send(store, "alice", "bob", {make_coin(4, "ucore")});
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(bank.balance(store, "alice", "ucore").amount, 6u);
  EXPECT_EQ(bank.balance(store, "bob", "ucore").amount, 4u);
  EXPECT_EQ(bank.supply(store, "ucore").amount, 10u);
  EXPECT_EQ(result.events[0].type, "transfer");
  EXPECT_EQ(result.events[0].attribute("sender"), "alice");
}

TEST(bank, zero_only_amounts_are_rejected) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  auto result = bank.mint(store, "alice", {make_coin(0, "ucore")});
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.log, "Cannot transfer empty coins amount");
}

TEST(bank, multi_coin_burn_is_all_or_nothing) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  bank.init_balance(store, "alice",
                    {make_coin(10, "uatom"), make_coin(1, "ucore")});

  auto result = bank.burn(store, "alice",
                          {make_coin(3, "uatom"), make_coin(2, "ucore")});
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(bank.balance(store, "alice", "uatom").amount, 10u);
}

TEST(bank, all_balances_are_sorted_by_denom) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  bank.init_balance(store, "alice",
                    {make_coin(1, "zeta"), make_coin(2, "alpha")});
  bank.init_balance(store, "alicex", {make_coin(3, "beta")});

  auto balances = bank.all_balances(store, "alice");
  ASSERT_EQ(balances.size(), 2u);
  EXPECT_EQ(balances[0], make_coin(2, "alpha"));
  EXPECT_EQ(balances[1], make_coin(1, "zeta"));
}

TEST(bank, repeated_denom_burn_is_checked_against_the_sum) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  bank.init_balance(store, "alice", {make_coin(1500, "x")});

  auto result = bank.burn(store, "alice",
                          {make_coin(1000, "x"), make_coin(1000, "x")});
  EXPECT_EQ(result.log, "Overflow: Cannot Sub with 1500 and 2000");
  EXPECT_EQ(bank.balance(store, "alice", "x").amount, 1500u);
  EXPECT_EQ(bank.supply(store, "x").amount, 1500u);

  auto merged = bank.burn(store, "alice",
                          {make_coin(500, "x"), make_coin(700, "x")});
  ASSERT_TRUE(merged.ok()) << merged.log;
  EXPECT_EQ(bank.balance(store, "alice", "x").amount, 300u);
  EXPECT_EQ(bank.supply(store, "x").amount, 300u);
  EXPECT_EQ(merged.events[0].attribute("amount"), "1200x");
}

TEST(bank, repeated_denom_send_is_checked_against_the_sum) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  bank.init_balance(store, "alice", {make_coin(1500, "x")});

  auto result = bank.send(store, "alice", "bob",
                          {make_coin(1000, "x"), make_coin(1000, "x")});
  EXPECT_EQ(result.log, "Overflow: Cannot Sub with 1500 and 2000");
  EXPECT_EQ(bank.balance(store, "alice", "x").amount, 1500u);
  EXPECT_EQ(bank.balance(store, "bob", "x").amount, 0u);

  auto merged = bank.send(store, "alice", "bob",
                          {make_coin(1000, "x"), make_coin(500, "x")});
  ASSERT_TRUE(merged.ok()) << merged.log;
  EXPECT_EQ(bank.balance(store, "alice", "x").amount, 0u);
  EXPECT_EQ(bank.balance(store, "bob", "x").amount, 1500u);
}

TEST(bank, repeated_denom_mint_cannot_wrap) {
  auto store = cwsim::ledger::store_t{};
  auto bank = cwsim::ledger::bank_keeper{};
  auto max = cwsim::schema::coin_t{
      .denom = "x", .amount = std::numeric_limits<cwsim::schema::amount_t>::max()};

  auto result = bank.mint(store, "alice", {max, make_coin(1, "x")});
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.log,
            "Overflow: Cannot Add with 340282366920938463463374607431768211455 "
            "and 1");
  EXPECT_EQ(bank.balance(store, "alice", "x").amount, 0u);
  EXPECT_EQ(bank.supply(store, "x").amount, 0u);

  auto merged = bank.mint(store, "alice", {make_coin(2, "x"), make_coin(3, "x")});
  ASSERT_TRUE(merged.ok()) << merged.log;
  EXPECT_EQ(bank.balance(store, "alice", "x").amount, 5u);
  EXPECT_EQ(bank.supply(store, "x").amount, 5u);
}
