#pragma once
#include <strata/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace strata::codec {

/// Bounds-checked cursor over a byte source. Every read past the end throws
/// malformed_stream_error and leaves the position unchanged.
class reader final {
 public:
  explicit reader(strata::schema::bytes_view_t bytes);

  uint8_t read_u8();
  uint16_t read_u16();
  uint32_t read_u32();
  int32_t read_i32();
  double read_f64();
  strata::schema::bytes_view_t read_bytes(size_t count);

  /// uint32 length prefix, rejected when above `limit` or when fewer than
  /// `length * min_element_size` bytes remain.
  size_t read_length(uint32_t limit, size_t min_element_size = 1);

  size_t position() const { return position_; }
  /// Moves back to an earlier position, used to undo a failed decode.
  void rewind(size_t position);
  size_t remaining() const { return bytes_.size() - position_; }
  bool exhausted() const { return remaining() == 0; }

 private:
  strata::schema::bytes_view_t take(size_t count, std::string_view what);

  strata::schema::bytes_view_t bytes_;
  size_t position_{0};
};

}  // namespace strata::codec
