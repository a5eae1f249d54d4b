#pragma once

#include <provenance/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Compliance workflow: canonical key prefixes for roles, batches, certificate
// assets, vendor indexes and the system keyspace (asset facility, audit log,
// committed state). Prefixes are pairwise non-overlapping.
namespace provenance::schema::key {

inline constexpr std::string_view kRoleKeyPrefix{"role:"};
inline constexpr std::string_view kBatchKeyPrefix{"batch:"};
inline constexpr std::string_view kAssetKeyPrefix{"asset:"};
inline constexpr std::string_view kVendorKeyPrefix{"vendor:"};
inline constexpr std::string_view kAssetRecordPrefix{"SYS|ASSET|"};
inline constexpr std::string_view kAssetSeqKey{"SYS|ASSET_SEQ"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};
inline constexpr std::string_view kEventSeqKey{"SYS|EVENT_SEQ"};
inline constexpr std::string_view kCommittedStateKey{"SYS|APP|COMMITTED"};
inline constexpr std::string_view kAdministratorKey{"SYS|APP|ADMINISTRATOR"};

inline const std::array<std::string_view, 10> kEngineKeyspaces{
    kRoleKeyPrefix,     kBatchKeyPrefix,    kAssetKeyPrefix,
    kVendorKeyPrefix,   kAssetRecordPrefix, kAssetSeqKey,
    kEventPrefix,       kEventSeqKey,       kCommittedStateKey,
    kAdministratorKey};

provenance::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const provenance::schema::bytes_view_t& id);

provenance::schema::bytes_t make_role_key(
    const provenance::schema::account_id_t& account);

provenance::schema::bytes_t make_batch_key(
    const provenance::schema::bytes_view_t& batch_id);

provenance::schema::bytes_t make_asset_key(
    const provenance::schema::bytes_view_t& batch_id);

provenance::schema::bytes_t make_vendor_key(
    const provenance::schema::account_id_t& vendor);

provenance::schema::bytes_t make_asset_record_key(
    provenance::schema::asset_id_t asset_id);

provenance::schema::bytes_t make_event_key(uint64_t event_id);

/// Inverse of make_event_key; std::nullopt for keys outside the event space.
std::optional<uint64_t> parse_event_key(
    const provenance::schema::bytes_view_t& key);

}  // namespace provenance::schema::key
