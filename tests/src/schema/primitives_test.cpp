#include <gtest/gtest.h>
#include <cwsim/schema/primitives.hpp>

#include <limits>
#include <string>
#include <string_view>

TEST(primitives, hex_is_lowercase_and_zero_padded) {
  auto bytes = cwsim::schema::bytes_t{0x00, 0x0a, 0xff, 0x42};
  auto hex = cwsim::schema::to_hex(cwsim::schema::make_bytes_view(bytes));
  EXPECT_EQ(hex, "000aff42");
  EXPECT_TRUE(cwsim::schema::to_hex(cwsim::schema::bytes_view_t{}).empty());
}

TEST(primitives, base64_matches_known_vectors) {
  EXPECT_EQ(cwsim::schema::to_base64(cwsim::schema::make_bytes(
                std::string_view{"f"})),
            "Zg==");
  EXPECT_EQ(cwsim::schema::to_base64(cwsim::schema::make_bytes(
                std::string_view{"fo"})),
            "Zm8=");
  EXPECT_EQ(cwsim::schema::to_base64(cwsim::schema::make_bytes(
                std::string_view{"foo"})),
            "Zm9v");
  EXPECT_EQ(cwsim::schema::to_base64(cwsim::schema::make_bytes(
                std::string_view{"foobar"})),
            "Zm9vYmFy");
}

TEST(primitives, parse_amount_accepts_full_uint128_range) {
  auto max = std::string{"340282366920938463463374607431768211455"};
  auto parsed = cwsim::schema::try_parse_amount(max);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, std::numeric_limits<cwsim::schema::amount_t>::max());
  EXPECT_EQ(cwsim::schema::to_string(*parsed), max);
}

TEST(primitives, parse_amount_rejects_overflow_sign_and_empty) {
  EXPECT_FALSE(cwsim::schema::try_parse_amount(
                   "340282366920938463463374607431768211456")
                   .has_value());
  EXPECT_FALSE(cwsim::schema::try_parse_amount("").has_value());
  EXPECT_FALSE(cwsim::schema::try_parse_amount("-1").has_value());
  EXPECT_FALSE(cwsim::schema::try_parse_amount("12a").has_value());
  EXPECT_EQ(cwsim::schema::try_parse_amount("0007"),
            cwsim::schema::amount_t{7});
}
