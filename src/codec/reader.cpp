#include <boost/endian/buffers.hpp>
#include <strata/codec/reader.hpp>
#include <strata/common/error.hpp>

#include <bit>
#include <cstring>

namespace strata::codec {

namespace {

template <typename Buffer>
auto load(const strata::schema::bytes_view_t& bytes) {
  auto buffer = Buffer{};
  std::memcpy(buffer.data(), bytes.data(), sizeof(Buffer));
  return buffer.value();
}

}  // namespace

reader::reader(strata::schema::bytes_view_t bytes) : bytes_(bytes) {}

strata::schema::bytes_view_t reader::take(const size_t count,
                                          const std::string_view what) {
  if (count > remaining()) {
    throw malformed_stream_error{fmt::format(
        "truncated stream reading {}: need {} byte(s) at offset {}, have {}",
        what, count, position_, remaining())};
  }
  auto out = bytes_.subspan(position_, count);
  position_ += count;
  return out;
}

void reader::rewind(const size_t position) {
  if (position > position_) {
    strata::common::critical("reader cannot rewind forward from {} to {}",
                             position_, position);
  }
  position_ = position;
}

uint8_t reader::read_u8() {
  return take(1, "u8")[0];
}

uint16_t reader::read_u16() {
  return load<boost::endian::big_uint16_buf_t>(take(2, "u16"));
}

uint32_t reader::read_u32() {
  return load<boost::endian::big_uint32_buf_t>(take(4, "u32"));
}

int32_t reader::read_i32() {
  return load<boost::endian::big_int32_buf_t>(take(4, "i32"));
}

double reader::read_f64() {
  return std::bit_cast<double>(
      load<boost::endian::big_uint64_buf_t>(take(8, "f64")));
}

strata::schema::bytes_view_t reader::read_bytes(const size_t count) {
  return take(count, "bytes");
}

size_t reader::read_length(const uint32_t limit,
                           const size_t min_element_size) {
  const auto start = position_;
  const auto length = read_u32();
  if (length > limit) {
    position_ = start;
    throw malformed_stream_error{fmt::format(
        "declared length {} at offset {} exceeds the limit {}", length, start,
        limit)};
  }
  if (static_cast<uint64_t>(length) * min_element_size > remaining()) {
    position_ = start;
    throw malformed_stream_error{fmt::format(
        "declared length {} at offset {} exceeds the {} remaining byte(s)",
        length, start, remaining())};
  }
  return length;
}

}  // namespace strata::codec
