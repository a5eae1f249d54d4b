#include <boost/endian/buffers.hpp>
#include <algorithm>
#include <iterator>
#include <provenance/schema/key/builder.hpp>
#include <ranges>

using namespace provenance::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write_big_endian(const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  std::ranges::copy_n(buffer.data(), sizeof(buffer), std::back_inserter(data));
  return *this;
}
