#include <gtest/gtest.h>
#include <cosmos/base/v1beta1/coin.pb.h>
#include <cwsim/ledger/types.hpp>

#include <string>
#include <string_view>

namespace {

using store_t = cwsim::ledger::store_t;

cwsim::schema::bytes_t key(const std::string_view value) {
  return cwsim::schema::make_bytes(value);
}

cosmos::base::v1beta1::Coin make_record(const std::string& amount) {
  auto coin = cosmos::base::v1beta1::Coin{};
  coin.set_denom("ucore");
  coin.set_amount(amount);
  return coin;
}

}  // namespace

TEST(storage_types, defaults_are_empty) {
  auto store = store_t{};
  EXPECT_TRUE(store.entries.empty());

  auto entry = cwsim::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, put_get_remove_round_trips) {
  auto store = store_t{};
  auto encoder = cwsim::ledger::encoder_t{};
  auto k = key("bank|one");

  EXPECT_FALSE(store
                   .get<cosmos::base::v1beta1::Coin>(
                       encoder, cwsim::schema::make_bytes_view(k))
                   .has_value());
  store.put(encoder, cwsim::schema::make_bytes_view(k), make_record("5"));
  EXPECT_TRUE(store.contains(cwsim::schema::make_bytes_view(k)));

  auto loaded = store.get<cosmos::base::v1beta1::Coin>(
      encoder, cwsim::schema::make_bytes_view(k));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->amount(), "5");

  store.put(encoder, cwsim::schema::make_bytes_view(k), make_record("6"));
  EXPECT_EQ(store
                .get<cosmos::base::v1beta1::Coin>(
                    encoder, cwsim::schema::make_bytes_view(k))
                ->amount(),
            "6");

  store.remove(cwsim::schema::make_bytes_view(k));
  EXPECT_FALSE(store.contains(cwsim::schema::make_bytes_view(k)));
  store.remove(cwsim::schema::make_bytes_view(k));
}

TEST(storage_types, list_by_prefix_is_ordered_and_bounded) {
  auto store = store_t{};
  auto encoder = cwsim::ledger::encoder_t{};
  for (auto name : {"A|two", "B|one", "A|one", "A", "A|three"}) {
    auto k = key(name);
    store.put(encoder, cwsim::schema::make_bytes_view(k), make_record("1"));
  }

  auto prefix = key("A|");
  auto rows = store.list_by_prefix(cwsim::schema::make_bytes_view(prefix));
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(cwsim::schema::make_string(rows[0].first), "A|one");
  EXPECT_EQ(cwsim::schema::make_string(rows[1].first), "A|three");
  EXPECT_EQ(cwsim::schema::make_string(rows[2].first), "A|two");

  auto none = key("C|");
  EXPECT_TRUE(
      store.list_by_prefix(cwsim::schema::make_bytes_view(none)).empty());
}

TEST(storage_types, restore_discards_writes_after_checkpoint) {
  auto store = store_t{};
  auto encoder = cwsim::ledger::encoder_t{};
  auto kept = key("kept");
  auto dropped = key("dropped");
  store.put(encoder, cwsim::schema::make_bytes_view(kept), make_record("1"));

  auto snapshot = store.checkpoint();
  store.put(encoder, cwsim::schema::make_bytes_view(dropped), make_record("2"));
  store.remove(cwsim::schema::make_bytes_view(kept));
  store.restore(std::move(snapshot));

  EXPECT_TRUE(store.contains(cwsim::schema::make_bytes_view(kept)));
  EXPECT_FALSE(store.contains(cwsim::schema::make_bytes_view(dropped)));
}
