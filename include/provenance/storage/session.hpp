#pragma once
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/storage/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace provenance::storage {

/// Write staging for a single call.
///
/// Reads see the call's own staged writes first and fall through to the
/// backing store. Nothing reaches the store until `commit()`; a session that
/// is destroyed without committing leaves the store untouched.
template <typename Library>
class session final {
 public:
  using encoder_t = provenance::schema::encoding::scale_encoder_t;

  session(encoder_t& encoder, storage<Library>& store)
      : encoder_{encoder}, store_{store} {}

  session(const session&) = delete;
  session& operator=(const session&) = delete;
  session(session&&) = delete;
  session& operator=(session&&) = delete;
  ~session() = default;

  template <typename T>
  std::optional<T> get(const provenance::schema::bytes_view_t& key) {
    auto staged = staged_.find(provenance::schema::make_bytes(key));
    if (staged != std::end(staged_)) {
      return encoder_.template decode<T>(provenance::schema::bytes_view_t{
          staged->second.data(), staged->second.size()});
    }
    return store_.template get<T>(encoder_, key);
  }

  bool contains(const provenance::schema::bytes_view_t& key) const {
    if (staged_.contains(provenance::schema::make_bytes(key))) {
      return true;
    }
    return store_.get_raw(key).has_value();
  }

  template <typename T>
  void put(const provenance::schema::bytes_view_t& key, const T& value) {
    staged_.insert_or_assign(provenance::schema::make_bytes(key),
                             encoder_.encode(value));
  }

  /// Push every staged write to the store as one atomic batch.
  void commit() {
    if (committed_ || staged_.empty()) {
      committed_ = true;
      return;
    }
    auto entries = std::vector<key_value_entry_t>{};
    entries.reserve(staged_.size());
    for (auto& [key, value] : staged_) {
      entries.emplace_back(key, value);
    }
    store_.write(entries);
    committed_ = true;
  }

  std::size_t staged_size() const { return staged_.size(); }
  bool committed() const { return committed_; }
  encoder_t& encoder() { return encoder_; }

 private:
  encoder_t& encoder_;
  storage<Library>& store_;
  std::map<provenance::schema::bytes_t, provenance::schema::bytes_t> staged_;
  bool committed_{false};
};

}  // namespace provenance::storage
