#include <gtest/gtest.h>
#include <provenance/schema/audit_event_record.hpp>
#include <provenance/schema/batch_status.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/role_id.hpp>
#include <provenance/schema/transaction.hpp>
#include <provenance/testing/common.hpp>

namespace {

using encoder_t = provenance::schema::encoding::scale_encoder_t;

}  // namespace

TEST(encoding, enums_encode_as_single_code_byte) {
  auto encoder = encoder_t{};
  EXPECT_EQ(encoder.encode(provenance::schema::batch_status_t::certified),
            (provenance::schema::bytes_t{0x02}));
  EXPECT_EQ(encoder.encode(provenance::schema::role_id_t::inspector),
            (provenance::schema::bytes_t{0x02}));
}

TEST(encoding, unknown_enum_codes_are_rejected) {
  auto encoder = encoder_t{};
  auto invalid = provenance::schema::bytes_t{0x05};
  EXPECT_FALSE(encoder
                   .try_decode<provenance::schema::batch_status_t>(
                       provenance::schema::make_bytes_view(invalid))
                   .has_value());
}

TEST(encoding, transaction_envelope_preserves_payload) {
  auto encoder = encoder_t{};
  auto tx = provenance::schema::transaction_t{
      .version = 1,
      .sender = provenance::testing::make_hash(7),
      .payload = provenance::schema::create_batch_t{
          .batch_id = provenance::testing::make_batch_id("LOT-001")}};
  auto encoded = encoder.encode(tx);
  auto decoded = encoder.try_decode<provenance::schema::transaction_t>(
      provenance::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->version, 1u);
  EXPECT_EQ(decoded->sender, tx.sender);
  ASSERT_TRUE(std::holds_alternative<provenance::schema::create_batch_t>(
      decoded->payload));
  EXPECT_EQ(std::get<provenance::schema::create_batch_t>(decoded->payload)
                .batch_id,
            provenance::testing::make_batch_id("LOT-001"));
}

TEST(encoding, truncated_envelope_fails_to_decode) {
  auto encoder = encoder_t{};
  auto tx = provenance::schema::transaction_t{
      .sender = provenance::testing::make_hash(7),
      .payload = provenance::schema::assign_role_t{
          .account = provenance::testing::make_hash(8), .role = 1}};
  auto encoded = encoder.encode(tx);
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<provenance::schema::transaction_t>(
                       provenance::schema::make_bytes_view(encoded))
                   .has_value());
}
