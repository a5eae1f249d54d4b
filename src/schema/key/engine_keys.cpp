#include <provenance/schema/key/builder.hpp>
#include <provenance/schema/key/engine_keys.hpp>

#include <boost/endian/conversion.hpp>

namespace provenance::schema::key {

provenance::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const provenance::schema::bytes_view_t& id) {
  auto b = builder{};
  b.data.reserve(prefix.size() + id.size());
  b.write(prefix).write(id);
  return b.data;
}

provenance::schema::bytes_t make_role_key(
    const provenance::schema::account_id_t& account) {
  return make_prefixed_key(kRoleKeyPrefix, make_bytes_view(account));
}

provenance::schema::bytes_t make_batch_key(
    const provenance::schema::bytes_view_t& batch_id) {
  return make_prefixed_key(kBatchKeyPrefix, batch_id);
}

provenance::schema::bytes_t make_asset_key(
    const provenance::schema::bytes_view_t& batch_id) {
  return make_prefixed_key(kAssetKeyPrefix, batch_id);
}

provenance::schema::bytes_t make_vendor_key(
    const provenance::schema::account_id_t& vendor) {
  return make_prefixed_key(kVendorKeyPrefix, make_bytes_view(vendor));
}

provenance::schema::bytes_t make_asset_record_key(
    const provenance::schema::asset_id_t asset_id) {
  auto b = builder{};
  b.write(kAssetRecordPrefix).write_big_endian(asset_id);
  return b.data;
}

provenance::schema::bytes_t make_event_key(const uint64_t event_id) {
  auto b = builder{};
  b.write(kEventPrefix).write_big_endian(event_id);
  return b.data;
}

std::optional<uint64_t> parse_event_key(
    const provenance::schema::bytes_view_t& key) {
  auto view = make_string_view(key);
  if (!view.starts_with(kEventPrefix) ||
      view.size() != kEventPrefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  return boost::endian::load_big_u64(key.data() + kEventPrefix.size());
}

}  // namespace provenance::schema::key
