#include <gtest/gtest.h>
#include <credo/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = credo::schema::bytes_t(32, 0xAB);
  auto hash = credo::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = credo::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
  EXPECT_EQ(credo::schema::to_hex(hash),
            "0102030405060708090a0b0c0d0e0f10"
            "1112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(credo::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(credo::schema::try_make_hash32(std::string(64, 'g')).has_value());
  EXPECT_FALSE(credo::schema::try_make_hash32(std::string(63, 'a')).has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = credo::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, base64_round_trips_bytes) {
  auto payload = credo::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = credo::schema::to_base64(payload);
  EXPECT_EQ(encoded, "AQID/v8=");
  auto decoded = credo::schema::from_base64(encoded);
  EXPECT_EQ(decoded, payload);
}

TEST(primitives, base64_of_empty_input_is_empty) {
  auto encoded = credo::schema::to_base64(credo::schema::bytes_t{});
  EXPECT_TRUE(encoded.empty());
  auto decoded = credo::schema::try_from_base64("");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->empty());
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  auto decoded = credo::schema::try_from_base64("not base64***");
  EXPECT_FALSE(decoded.has_value());
  EXPECT_FALSE(credo::schema::try_from_base64("AQ=D").has_value());
}
