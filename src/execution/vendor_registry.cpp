#include <provenance/execution/vendor_registry.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/key/engine_keys.hpp>
#include <provenance/storage/memory/storage.hpp>
#include <provenance/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <iterator>

using namespace provenance::schema;

namespace provenance::execution {

template <typename Library>
std::vector<batch_id_t> vendor_registry<Library>::get_vendor_batches(
    provenance::storage::session<Library>& session,
    const account_id_t& vendor) const {
  auto key = key::make_vendor_key(vendor);
  auto joined = session.template get<bytes_t>(make_bytes_view(key));
  if (!joined) {
    return {};
  }
  return split(make_bytes_view(*joined));
}

template <typename Library>
void vendor_registry<Library>::append_batch(
    provenance::storage::session<Library>& session,
    const account_id_t& vendor,
    const bytes_view_t& batch_id) {
  auto key = key::make_vendor_key(vendor);
  auto joined =
      session.template get<bytes_t>(make_bytes_view(key)).value_or(bytes_t{});
  if (!joined.empty()) {
    joined.push_back(kDelimiter);
  }
  joined.insert(std::end(joined), std::begin(batch_id), std::end(batch_id));
  session.put(make_bytes_view(key), joined);
}

template <typename Library>
bytes_t vendor_registry<Library>::join(const std::vector<batch_id_t>& batches) {
  auto joined = bytes_t{};
  for (std::size_t i = 0; i < batches.size(); ++i) {
    if (i != 0) {
      joined.push_back(kDelimiter);
    }
    joined.insert(std::end(joined), std::begin(batches[i]),
                  std::end(batches[i]));
  }
  return joined;
}

template <typename Library>
std::vector<batch_id_t> vendor_registry<Library>::split(
    const bytes_view_t& joined) {
  auto batches = std::vector<batch_id_t>{};
  if (joined.empty()) {
    return batches;
  }
  auto begin = std::begin(joined);
  while (true) {
    auto end = std::find(begin, std::end(joined), kDelimiter);
    batches.emplace_back(begin, end);
    if (end == std::end(joined)) {
      break;
    }
    begin = std::next(end);
  }
  return batches;
}

template class vendor_registry<provenance::storage::rocksdb_storage_tag>;
template class vendor_registry<provenance::storage::memory_storage_tag>;

}  // namespace provenance::execution
