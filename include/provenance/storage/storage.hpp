#pragma once
#include <provenance/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace provenance::storage {

using key_value_entry_t =
    std::pair<provenance::schema::bytes_t, provenance::schema::bytes_t>;

/// Progress marker folded over every committed call.
struct committed_state final {
  uint64_t calls{};
  provenance::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const provenance::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const provenance::schema::bytes_view_t& key,
           const T& value);

  /// Return the raw stored bytes at key, or std::nullopt when missing.
  std::optional<provenance::schema::bytes_t> get_raw(
      const provenance::schema::bytes_view_t& key) const;

  /// Persist every entry in one atomic write.
  void write(const std::vector<key_value_entry_t>& entries);

  /// Return all key-value pairs that share the provided key prefix, in
  /// bytewise key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const provenance::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace provenance::storage
