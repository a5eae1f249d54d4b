#include <gtest/gtest.h>
#include <provenance/execution/audit_log.hpp>
#include <provenance/execution/call_frame.hpp>
#include <provenance/execution/role_registry.hpp>
#include <provenance/schema/role_id.hpp>
#include <provenance/schema/transaction_error_code.hpp>
#include <provenance/storage/memory/storage.hpp>
#include <provenance/storage/session.hpp>
#include <provenance/testing/execution_fixture.hpp>

#include <variant>

namespace {

using library_t = provenance::storage::memory_storage_tag;
using provenance::schema::role_id_t;
using provenance::schema::transaction_error_code;
using provenance::testing::execution_fixture;
using provenance::testing::make_assign_role;

}  // namespace

TEST(role_registry, administrator_reads_as_admin_without_storage) {
  auto encoder = provenance::testing::scale_encoder_t{};
  auto storage = provenance::storage::make_storage<library_t>("");
  auto audit = provenance::execution::audit_log<library_t>{};
  auto roles = provenance::execution::role_registry<library_t>{
      provenance::testing::make_hash(1), audit};
  auto session = provenance::storage::session<library_t>{encoder, storage};

  EXPECT_EQ(roles.get_role(session, provenance::testing::make_hash(1)),
            role_id_t::administrator);
  EXPECT_EQ(roles.get_role(session, provenance::testing::make_hash(2)),
            role_id_t::none);
  EXPECT_TRUE(storage.entries.empty());
}

TEST(role_registry, assign_stages_role_and_event) {
  auto encoder = provenance::testing::scale_encoder_t{};
  auto storage = provenance::storage::make_storage<library_t>("");
  auto audit = provenance::execution::audit_log<library_t>{};
  const auto admin = provenance::testing::make_hash(1);
  const auto account = provenance::testing::make_hash(2);
  auto roles = provenance::execution::role_registry<library_t>{admin, audit};
  auto session = provenance::storage::session<library_t>{encoder, storage};
  auto frame = provenance::execution::call_frame<library_t>{
      .session = session, .caller = admin, .call_index = 1};

  auto assigned = roles.assign_role(frame, account, 2);
  ASSERT_TRUE(std::holds_alternative<role_id_t>(assigned));
  EXPECT_EQ(std::get<role_id_t>(assigned), role_id_t::inspector);
  EXPECT_EQ(roles.get_role(session, account), role_id_t::inspector);
  ASSERT_EQ(frame.events.size(), 1u);
  EXPECT_EQ(frame.events[0].type, "assign_role");

  EXPECT_TRUE(storage.entries.empty());
  session.commit();
  EXPECT_FALSE(storage.entries.empty());
}

TEST(role_registry, only_administrator_assigns) {
  auto fixture = execution_fixture{};
  auto& engine = fixture.engine();
  const auto target = provenance::testing::make_hash(90);

  auto by_outsider =
      engine.execute(make_assign_role(execution_fixture::outsider(), target, 1));
  EXPECT_EQ(by_outsider.code,
            static_cast<uint32_t>(transaction_error_code::unauthorized));

  fixture.assign_default_roles();
  auto by_vendor =
      engine.execute(make_assign_role(execution_fixture::vendor(), target, 1));
  EXPECT_EQ(by_vendor.code,
            static_cast<uint32_t>(transaction_error_code::unauthorized));
  EXPECT_EQ(engine.get_role(target), role_id_t::none);
}

TEST(role_registry, unauthorized_is_reported_before_invalid_role) {
  auto fixture = execution_fixture{};
  auto result = fixture.engine().execute(make_assign_role(
      execution_fixture::outsider(), provenance::testing::make_hash(90), 7));
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(transaction_error_code::unauthorized));
}

TEST(role_registry, only_vendor_and_inspector_can_be_stored) {
  auto fixture = execution_fixture{};
  auto& engine = fixture.engine();
  const auto admin = execution_fixture::administrator();
  const auto target = provenance::testing::make_hash(90);
  const auto invalid =
      static_cast<uint32_t>(transaction_error_code::invalid_argument);

  EXPECT_EQ(engine.execute(make_assign_role(admin, target, 0)).code, invalid);
  EXPECT_EQ(engine.execute(make_assign_role(admin, target, 3)).code, invalid);
  EXPECT_EQ(engine.execute(make_assign_role(admin, target, 99)).code, invalid);
  EXPECT_EQ(engine.get_role(target), role_id_t::none);
  EXPECT_EQ(engine.info().committed_calls, 0u);
}

TEST(role_registry, reassignment_overwrites) {
  auto fixture = execution_fixture{};
  auto& engine = fixture.engine();
  const auto admin = execution_fixture::administrator();
  const auto target = provenance::testing::make_hash(90);

  ASSERT_EQ(engine.execute(make_assign_role(admin, target, 1)).code, 0u);
  EXPECT_EQ(engine.get_role(target), role_id_t::vendor);
  ASSERT_EQ(engine.execute(make_assign_role(admin, target, 2)).code, 0u);
  EXPECT_EQ(engine.get_role(target), role_id_t::inspector);
}

TEST(role_registry, administrator_assignment_does_not_shadow_admin) {
  auto fixture = execution_fixture{};
  auto& engine = fixture.engine();
  const auto admin = execution_fixture::administrator();

  ASSERT_EQ(engine.execute(make_assign_role(admin, admin, 1)).code, 0u);
  EXPECT_EQ(engine.get_role(admin), role_id_t::administrator);

  auto created =
      engine.execute(provenance::testing::make_create_batch(admin, "B-1"));
  EXPECT_EQ(created.code,
            static_cast<uint32_t>(transaction_error_code::unauthorized));
}
