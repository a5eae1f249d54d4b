#pragma once

#include <provenance/schema/primitives.hpp>
#include <provenance/storage/session.hpp>

#include <vector>

namespace provenance::execution {

template <typename Library>
class batch_lifecycle;

/// Ordered index of the batches each vendor created.
///
/// The list is an ordered sequence at this API and a `|`-joined byte string
/// in storage. Appending is reserved to batch creation so that a batch is
/// listed iff its state entry exists.
template <typename Library>
class vendor_registry final {
 public:
  static constexpr auto kDelimiter = uint8_t{'|'};

  std::vector<provenance::schema::batch_id_t> get_vendor_batches(
      provenance::storage::session<Library>& session,
      const provenance::schema::account_id_t& vendor) const;

  /// Storage form of the list.
  static provenance::schema::bytes_t join(
      const std::vector<provenance::schema::batch_id_t>& batches);
  static std::vector<provenance::schema::batch_id_t> split(
      const provenance::schema::bytes_view_t& joined);

 private:
  friend class batch_lifecycle<Library>;

  void append_batch(provenance::storage::session<Library>& session,
                    const provenance::schema::account_id_t& vendor,
                    const provenance::schema::bytes_view_t& batch_id);
};

}  // namespace provenance::execution
