#pragma once
#include <provenance/schema/primitives.hpp>
#include <optional>

namespace provenance::schema::encoding {

// The wire codec is chosen at build time through the tag parameter. Every
// persisted value and every call envelope goes through one of these.
template <typename Library>
struct encoder {
  template <typename T>
  provenance::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, provenance::schema::bytes_t& out);

  template <typename T>
  T decode(const provenance::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const provenance::schema::bytes_view_t& bytes);
};

}  // namespace provenance::schema::encoding
