#pragma once
#include <provenance/storage/storage.hpp>
#include <algorithm>
#include <map>
#include <string_view>

namespace provenance::storage {

/// Ordered in-process backend. Bytewise key order matches RocksDB's default
/// comparator, so prefix listings agree between the two backends.
struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::map<provenance::schema::bytes_t, provenance::schema::bytes_t> entries;
  uint64_t writes{};

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const provenance::schema::bytes_view_t& key) const {
    auto value = get_raw(key);
    if (!value) {
      return std::nullopt;
    }
    return {encoder.template decode<T>(
        provenance::schema::bytes_view_t{value->data(), value->size()})};
  }

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const provenance::schema::bytes_view_t& key,
           const T& value) {
    entries.insert_or_assign(provenance::schema::make_bytes(key),
                             encoder.encode(value));
    ++writes;
  }

  std::optional<provenance::schema::bytes_t> get_raw(
      const provenance::schema::bytes_view_t& key) const {
    auto it = entries.find(provenance::schema::make_bytes(key));
    if (it == std::end(entries)) {
      return std::nullopt;
    }
    return it->second;
  }

  void write(const std::vector<key_value_entry_t>& batch) {
    for (const auto& [key, value] : batch) {
      entries.insert_or_assign(key, value);
    }
    ++writes;
  }

  std::vector<key_value_entry_t> list_by_prefix(
      const provenance::schema::bytes_view_t& prefix) const {
    auto out = std::vector<key_value_entry_t>{};
    for (auto it = entries.lower_bound(provenance::schema::make_bytes(prefix));
         it != std::end(entries); ++it) {
      if (it->first.size() < prefix.size() ||
          !std::equal(std::begin(prefix), std::end(prefix),
                      std::begin(it->first))) {
        break;
      }
      out.push_back(*it);
    }
    return out;
  }
};

template <>
inline storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  static_cast<void>(path);
  return storage<memory_storage_tag>{};
}

}  // namespace provenance::storage
