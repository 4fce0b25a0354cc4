#pragma once
#include <strata/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace strata::codec {

/// Append-only byte sink. Multi-byte values are written big-endian.
struct writer final {
  strata::schema::bytes_t data;

  writer& write(bool value);
  writer& write(uint8_t value);
  writer& write(uint16_t value);
  writer& write(uint32_t value);
  writer& write(int32_t value);
  writer& write(double value);
  writer& write(const std::span<const uint8_t>& bytes);
  writer& write(const std::string_view& str);

  // Would otherwise bind to write(bool) and write(int32_t).
  writer& write(const char* str) = delete;
  writer& write(char value) = delete;

  /// uint32 length prefix. Throws serialization_error past 2^32 - 1.
  writer& write_length(size_t length);

  size_t size() const { return data.size(); }
};

}  // namespace strata::codec
