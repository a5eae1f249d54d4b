#pragma once
#include <provenance/common/critical.hpp>
#include <provenance/schema/encoding/encoder.hpp>
#include <provenance/schema/encoding/scale/batch_status.hpp>
#include <provenance/schema/encoding/scale/role_id.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Aggregate schema records (transactions, audit events, certificate assets)
// are encoded field by field in declaration order by scale-codec's
// decomposition; only enums need an explicit value list.
namespace provenance::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  provenance::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, provenance::schema::bytes_t& out);

  template <typename T>
  T decode(const provenance::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const provenance::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
provenance::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    provenance::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        provenance::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const provenance::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    provenance::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const provenance::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace provenance::schema::encoding
