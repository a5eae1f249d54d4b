#include <gtest/gtest.h>
#include <provenance/blake3/hash.hpp>
#include <provenance/execution/certification_minter.hpp>
#include <provenance/schema/batch_status.hpp>
#include <provenance/schema/certificate_asset.hpp>
#include <provenance/schema/query_error_code.hpp>
#include <provenance/schema/transaction_error_code.hpp>
#include <provenance/testing/execution_fixture.hpp>

#include <cstdint>
#include <string>

namespace {

using provenance::schema::batch_status_t;
using provenance::testing::execution_fixture;
using provenance::testing::make_approve_batch;
using provenance::testing::make_certify_batch;
using provenance::testing::make_create_batch;

void advance_to_approved(execution_fixture& fixture, const std::string& id) {
  auto& engine = fixture.engine();
  ASSERT_EQ(engine.execute(make_create_batch(execution_fixture::vendor(), id))
                .code,
            0u);
  ASSERT_EQ(
      engine.execute(make_approve_batch(execution_fixture::inspector(), id))
          .code,
      0u);
}

}  // namespace

TEST(certification, certificate_has_fixed_parameters) {
  auto fixture = execution_fixture{};
  fixture.assign_default_roles();
  advance_to_approved(fixture, "LOT-7");
  auto& engine = fixture.engine();
  ASSERT_EQ(
      engine.execute(make_certify_batch(execution_fixture::inspector(), "LOT-7"))
          .code,
      0u);

  auto batch_id = provenance::testing::make_batch_id("LOT-7");
  auto asset =
      engine.get_certificate(provenance::schema::make_bytes_view(batch_id));
  ASSERT_TRUE(asset.has_value());
  EXPECT_EQ(asset->asset_id,
            engine.get_batch_asset(provenance::schema::make_bytes_view(batch_id)));
  EXPECT_EQ(asset->total, 1u);
  EXPECT_EQ(asset->decimals, 0u);
  EXPECT_FALSE(asset->default_frozen);
  EXPECT_EQ(provenance::schema::make_string(asset->unit_name), "CERT");
  EXPECT_EQ(provenance::schema::make_string(asset->asset_name), "CERT-LOT-7");
  EXPECT_EQ(asset->batch_id, batch_id);

  auto application = engine.info().application;
  EXPECT_EQ(asset->manager, application);
  EXPECT_EQ(asset->reserve, application);
  EXPECT_NE(application, execution_fixture::administrator());
  EXPECT_EQ(asset->freeze, provenance::schema::make_zero_hash());
  EXPECT_EQ(asset->clawback, provenance::schema::make_zero_hash());
  EXPECT_EQ(asset->metadata_hash,
            provenance::blake3::hash(std::string_view{"CERT-LOT-7"}));
  EXPECT_EQ(asset->created_at_call, engine.info().committed_calls);
}

TEST(certification, asset_ids_are_unique_and_increasing) {
  auto fixture = execution_fixture{};
  fixture.assign_default_roles();
  auto& engine = fixture.engine();
  auto previous = uint64_t{0};
  for (const auto* id : {"B-1", "B-2", "B-3"}) {
    advance_to_approved(fixture, id);
    ASSERT_EQ(
        engine.execute(make_certify_batch(execution_fixture::inspector(), id))
            .code,
        0u);
    auto batch_id = provenance::testing::make_batch_id(id);
    auto asset =
        engine.get_batch_asset(provenance::schema::make_bytes_view(batch_id));
    EXPECT_GT(asset, previous);
    previous = asset;
  }
  EXPECT_EQ(previous, 3u);
}

TEST(certification, minting_failure_discards_whole_call) {
  auto fixture = execution_fixture{};
  fixture.assign_default_roles();
  auto& engine = fixture.engine();

  // "CERT-" plus 28 bytes exceeds the 32-byte asset name limit.
  const auto long_id = std::string(28, 'L');
  advance_to_approved(fixture, long_id);
  auto before = engine.info();
  auto last_event = engine.events(1, UINT64_MAX).size();

  auto certified = engine.execute(
      make_certify_batch(execution_fixture::inspector(), long_id));
  EXPECT_EQ(certified.code,
            static_cast<uint32_t>(
                provenance::schema::transaction_error_code::minting_failure));
  EXPECT_TRUE(certified.events.empty());

  auto batch_id = provenance::testing::make_batch_id(long_id);
  auto view = provenance::schema::make_bytes_view(batch_id);
  EXPECT_EQ(engine.get_batch_status(view), batch_status_t::approved);
  EXPECT_EQ(engine.get_batch_asset(view), 0u);
  EXPECT_EQ(engine.events(1, UINT64_MAX).size(), last_event);
  EXPECT_EQ(engine.info().state_root, before.state_root);

  // The failed mint did not consume an asset id.
  advance_to_approved(fixture, "SHORT");
  ASSERT_EQ(
      engine.execute(make_certify_batch(execution_fixture::inspector(), "SHORT"))
          .code,
      0u);
  auto short_id = provenance::testing::make_batch_id("SHORT");
  EXPECT_EQ(engine.get_batch_asset(provenance::schema::make_bytes_view(short_id)),
            1u);
}

TEST(certification, longest_accepted_batch_id_mints) {
  auto fixture = execution_fixture{};
  fixture.assign_default_roles();
  const auto id = std::string(27, 'K');
  advance_to_approved(fixture, id);
  auto certified = fixture.engine().execute(
      make_certify_batch(execution_fixture::inspector(), id));
  EXPECT_EQ(certified.code, 0u) << certified.log;
}

TEST(certification, asset_name_is_prefixed_batch_id) {
  using minter_t = provenance::execution::certification_minter<
      provenance::storage::memory_storage_tag>;
  auto batch_id = provenance::testing::make_batch_id("B-100");
  EXPECT_EQ(provenance::schema::make_string(minter_t::make_asset_name(
                provenance::schema::make_bytes_view(batch_id))),
            "CERT-B-100");
}

TEST(certification, certificate_query_reports_missing_asset) {
  auto fixture = execution_fixture{};
  auto batch_id = provenance::testing::make_batch_id("B-100");
  auto query = fixture.engine().query(
      "/batch/certificate", provenance::schema::make_bytes_view(batch_id));
  EXPECT_EQ(query.code,
            static_cast<uint32_t>(provenance::schema::query_error_code::not_found));
}
