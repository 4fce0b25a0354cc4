#include <strata/codec/builtin.hpp>
#include <strata/common/error.hpp>
#include <strata/engine/loader.hpp>

#include <iterator>
#include <utility>

using namespace strata::schema;

namespace strata::codec {

namespace {

// Smallest possible encoding of one tagged element: the tag alone.
constexpr auto kMinElementSize = sizeof(tag_t);

void encode_items(strata::engine::loader& loader,
                  const std::vector<std::any>& items,
                  writer& out,
                  const options& options) {
  out.write_length(items.size());
  for (const auto& item : items) {
    loader.serialize_element(item, out, options);
  }
}

std::vector<std::any> decode_items(strata::engine::loader& loader,
                                   reader& in,
                                   const options& options) {
  const auto length =
      in.read_length(loader.config().max_length, kMinElementSize);
  auto items = std::vector<std::any>{};
  items.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    items.push_back(loader.deserialize_element(in, options));
  }
  return items;
}

scalar_t decode_scalar(strata::engine::loader& loader,
                       reader& in,
                       const options& options,
                       const std::string_view what) {
  auto value = loader.deserialize_element(in, options);
  auto scalar = try_make_scalar(value);
  if (!scalar) {
    throw malformed_stream_error{
        fmt::format("{} of type '{}' is not a scalar", what,
                    loader.schemas().name_of(type_of(value)))};
  }
  return std::move(*scalar);
}

}  // namespace

void boolean_serializer::encode_value(strata::engine::loader&,
                                      const boolean_t& value,
                                      writer& out,
                                      const options&) const {
  out.write(value);
}

boolean_t boolean_serializer::decode_value(strata::engine::loader&,
                                           reader& in,
                                           const options&) const {
  const auto byte = in.read_u8();
  if (byte > 0x01u) {
    throw malformed_stream_error{
        fmt::format("invalid boolean byte 0x{:02x}", byte)};
  }
  return byte == 0x01u;
}

void integer_serializer::encode_value(strata::engine::loader&,
                                      const integer_t& value,
                                      writer& out,
                                      const options&) const {
  out.write(value);
}

integer_t integer_serializer::decode_value(strata::engine::loader&,
                                           reader& in,
                                           const options&) const {
  return in.read_i32();
}

void real_serializer::encode_value(strata::engine::loader&,
                                   const real_t& value,
                                   writer& out,
                                   const options&) const {
  out.write(value);
}

real_t real_serializer::decode_value(strata::engine::loader&,
                                     reader& in,
                                     const options&) const {
  return in.read_f64();
}

void string_serializer::encode_value(strata::engine::loader&,
                                     const string_t& value,
                                     writer& out,
                                     const options&) const {
  out.write_length(value.size());
  out.write(std::string_view{value});
}

string_t string_serializer::decode_value(strata::engine::loader& loader,
                                         reader& in,
                                         const options&) const {
  const auto length = in.read_length(loader.config().max_length);
  auto bytes = in.read_bytes(length);
  if (loader.config().validate_utf8 && !is_valid_utf8(bytes)) {
    throw malformed_stream_error{"string payload is not valid UTF-8"};
  }
  return make_string(bytes);
}

void list_serializer::encode_value(strata::engine::loader& loader,
                                   const list_t& value,
                                   writer& out,
                                   const options& options) const {
  encode_items(loader, value, out, options);
}

list_t list_serializer::decode_value(strata::engine::loader& loader,
                                     reader& in,
                                     const options& options) const {
  return decode_items(loader, in, options);
}

void tuple_serializer::encode_value(strata::engine::loader& loader,
                                    const tuple_t& value,
                                    writer& out,
                                    const options& options) const {
  encode_items(loader, value.items, out, options);
}

tuple_t tuple_serializer::decode_value(strata::engine::loader& loader,
                                       reader& in,
                                       const options& options) const {
  return tuple_t{.items = decode_items(loader, in, options)};
}

void set_serializer::encode_value(strata::engine::loader& loader,
                                  const set_t& value,
                                  writer& out,
                                  const options& options) const {
  out.write_length(value.size());
  for (const auto& element : value) {
    loader.serialize_element(to_any(element), out, options);
  }
}

set_t set_serializer::decode_value(strata::engine::loader& loader,
                                   reader& in,
                                   const options& options) const {
  const auto length =
      in.read_length(loader.config().max_length, kMinElementSize);
  auto out = set_t{};
  for (size_t i = 0; i < length; ++i) {
    if (!out.insert(decode_scalar(loader, in, options, "set element")).second) {
      throw malformed_stream_error{"set holds a duplicate element"};
    }
  }
  return out;
}

void map_serializer::encode_value(strata::engine::loader& loader,
                                  const map_t& value,
                                  writer& out,
                                  const options& options) const {
  out.write_length(value.size());
  for (const auto& [key, item] : value) {
    loader.serialize_element(to_any(key), out, options);
    loader.serialize_element(item, out, options);
  }
}

map_t map_serializer::decode_value(strata::engine::loader& loader,
                                   reader& in,
                                   const options& options) const {
  const auto length =
      in.read_length(loader.config().max_length, 2 * kMinElementSize);
  auto out = map_t{};
  for (size_t i = 0; i < length; ++i) {
    auto key = decode_scalar(loader, in, options, "mapping key");
    auto item = loader.deserialize_element(in, options);
    if (!out.emplace(std::move(key), std::move(item)).second) {
      throw malformed_stream_error{"mapping holds a duplicate key"};
    }
  }
  return out;
}

}  // namespace strata::codec
