#include <boost/endian/buffers.hpp>
#include <strata/codec/writer.hpp>
#include <strata/common/error.hpp>

#include <algorithm>
#include <bit>
#include <iterator>
#include <limits>

namespace strata::codec {

namespace {

template <typename Buffer>
void append(strata::schema::bytes_t& data, const Buffer& buffer) {
  const auto* first = reinterpret_cast<const uint8_t*>(buffer.data());
  std::copy_n(first, sizeof(Buffer), std::back_inserter(data));
}

}  // namespace

writer& writer::write(const bool value) {
  data.push_back(value ? uint8_t{0x01} : uint8_t{0x00});
  return *this;
}

writer& writer::write(const uint8_t value) {
  data.push_back(value);
  return *this;
}

writer& writer::write(const uint16_t value) {
  append(data, boost::endian::big_uint16_buf_t{value});
  return *this;
}

writer& writer::write(const uint32_t value) {
  append(data, boost::endian::big_uint32_buf_t{value});
  return *this;
}

writer& writer::write(const int32_t value) {
  append(data, boost::endian::big_int32_buf_t{value});
  return *this;
}

writer& writer::write(const double value) {
  append(data, boost::endian::big_uint64_buf_t{std::bit_cast<uint64_t>(value)});
  return *this;
}

writer& writer::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

writer& writer::write(const std::string_view& str) {
  return write(strata::schema::make_bytes_view(str));
}

writer& writer::write_length(const size_t length) {
  if (length > std::numeric_limits<uint32_t>::max()) {
    throw serialization_error{
        fmt::format("length {} does not fit the uint32 prefix", length)};
  }
  return write(static_cast<uint32_t>(length));
}

}  // namespace strata::codec
