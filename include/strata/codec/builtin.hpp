#pragma once
#include <strata/codec/serializer.hpp>
#include <strata/schema/primitives.hpp>

namespace strata::codec {

/// 1 byte, 0x00 or 0x01.
class boolean_serializer final
    : public typed_serializer<strata::schema::boolean_t> {
 protected:
  void encode_value(strata::engine::loader& loader,
                    const strata::schema::boolean_t& value,
                    writer& out,
                    const options& options) const override;
  strata::schema::boolean_t decode_value(strata::engine::loader& loader,
                                         reader& in,
                                         const options& options) const override;
};

/// 4 byte big-endian two's complement.
class integer_serializer final
    : public typed_serializer<strata::schema::integer_t> {
 protected:
  void encode_value(strata::engine::loader& loader,
                    const strata::schema::integer_t& value,
                    writer& out,
                    const options& options) const override;
  strata::schema::integer_t decode_value(strata::engine::loader& loader,
                                         reader& in,
                                         const options& options) const override;
};

/// 8 byte big-endian IEEE-754 binary64.
class real_serializer final : public typed_serializer<strata::schema::real_t> {
 protected:
  void encode_value(strata::engine::loader& loader,
                    const strata::schema::real_t& value,
                    writer& out,
                    const options& options) const override;
  strata::schema::real_t decode_value(strata::engine::loader& loader,
                                      reader& in,
                                      const options& options) const override;
};

/// uint32 byte length followed by the UTF-8 bytes.
class string_serializer final
    : public typed_serializer<strata::schema::string_t> {
 protected:
  void encode_value(strata::engine::loader& loader,
                    const strata::schema::string_t& value,
                    writer& out,
                    const options& options) const override;
  strata::schema::string_t decode_value(strata::engine::loader& loader,
                                        reader& in,
                                        const options& options) const override;
};

// The containers below write a uint32 count followed by their elements,
// each element prefixed with the type tag of its runtime type.

class list_serializer final : public typed_serializer<strata::schema::list_t> {
 protected:
  void encode_value(strata::engine::loader& loader,
                    const strata::schema::list_t& value,
                    writer& out,
                    const options& options) const override;
  strata::schema::list_t decode_value(strata::engine::loader& loader,
                                      reader& in,
                                      const options& options) const override;
};

class tuple_serializer final
    : public typed_serializer<strata::schema::tuple_t> {
 protected:
  void encode_value(strata::engine::loader& loader,
                    const strata::schema::tuple_t& value,
                    writer& out,
                    const options& options) const override;
  strata::schema::tuple_t decode_value(strata::engine::loader& loader,
                                       reader& in,
                                       const options& options) const override;
};

class set_serializer final : public typed_serializer<strata::schema::set_t> {
 protected:
  void encode_value(strata::engine::loader& loader,
                    const strata::schema::set_t& value,
                    writer& out,
                    const options& options) const override;
  strata::schema::set_t decode_value(strata::engine::loader& loader,
                                     reader& in,
                                     const options& options) const override;
};

/// Pairs are written key first, each side with its own tag.
class map_serializer final : public typed_serializer<strata::schema::map_t> {
 protected:
  void encode_value(strata::engine::loader& loader,
                    const strata::schema::map_t& value,
                    writer& out,
                    const options& options) const override;
  strata::schema::map_t decode_value(strata::engine::loader& loader,
                                     reader& in,
                                     const options& options) const override;
};

}  // namespace strata::codec
