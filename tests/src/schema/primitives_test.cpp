#include <gtest/gtest.h>
#include <provenance/blake3/hash.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/testing/common.hpp>

#include <string>

TEST(primitives, hex_round_trips_and_accepts_prefix) {
  auto bytes = provenance::schema::bytes_t{0x00, 0x7f, 0xab, 0xff};
  auto hex = provenance::schema::to_hex(provenance::schema::make_bytes_view(bytes));
  EXPECT_EQ(hex, "007fabff");

  auto decoded = provenance::schema::try_from_hex("0x007FABFF");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes);
}

TEST(primitives, hex_rejects_malformed_input) {
  EXPECT_FALSE(provenance::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(provenance::schema::try_from_hex("zz").has_value());
}

TEST(primitives, hash32_requires_exactly_32_bytes) {
  auto account = provenance::testing::make_hash(3);
  auto hex = provenance::schema::to_hex(account);
  EXPECT_EQ(hex.size(), 64u);

  auto parsed = provenance::schema::try_make_hash32(std::string_view{hex});
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, account);

  auto short_bytes = provenance::schema::bytes_t(31, 0x01);
  EXPECT_FALSE(provenance::schema::try_make_hash32(
                   provenance::schema::make_bytes_view(short_bytes))
                   .has_value());
}

TEST(primitives, string_and_bytes_views_agree) {
  auto text = std::string{"LOT-001"};
  auto bytes = provenance::schema::make_bytes(text);
  EXPECT_EQ(provenance::schema::make_string(bytes), text);
  EXPECT_EQ(provenance::schema::make_string_view(
                provenance::schema::make_bytes_view(text)),
            text);
}

TEST(primitives, zero_hash_is_all_zero) {
  for (const auto byte : provenance::schema::make_zero_hash()) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(blake3, hash_is_deterministic_and_input_sensitive) {
  auto first = provenance::blake3::hash(std::string_view{"CERT-LOT-001"});
  auto second = provenance::blake3::hash(std::string_view{"CERT-LOT-001"});
  auto other = provenance::blake3::hash(std::string_view{"CERT-LOT-002"});
  EXPECT_EQ(first, second);
  EXPECT_NE(first, other);
  EXPECT_NE(first, provenance::schema::make_zero_hash());
}

TEST(blake3, empty_input_matches_reference_digest) {
  auto digest = provenance::blake3::hash(std::string_view{});
  EXPECT_EQ(provenance::schema::to_hex(digest),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}
