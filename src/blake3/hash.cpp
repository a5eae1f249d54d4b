#include <blake3.h>
#include <provenance/blake3/hash.hpp>

namespace provenance::blake3 {

namespace {

provenance::schema::hash32_t finalize(blake3_hasher& hasher) {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<provenance::schema::hash32_t>);
  auto output = provenance::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

provenance::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  return finalize(hasher);
}

provenance::schema::hash32_t hash(
    const provenance::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  return finalize(hasher);
}

}  // namespace provenance::blake3
