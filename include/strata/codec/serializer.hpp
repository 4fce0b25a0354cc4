#pragma once
#include <strata/codec/reader.hpp>
#include <strata/codec/writer.hpp>
#include <strata/schema/primitives.hpp>
#include <any>
#include <cstdint>
#include <memory>

namespace strata::engine {
class loader;
}

namespace strata::codec {

/// Call-time options handed to every codec.
struct options final {
  /// Prefix the top-level value with its type tag.
  bool tagging{false};
  /// Nesting level of the value being coded; 0 is the top-level call. The
  /// loader increments it before handing control to a codec.
  uint32_t depth{0};
};

/// Codec for one type. Implementations hold no per-call state and recurse
/// into nested values through the loader.
class serializer {
 public:
  virtual ~serializer() = default;

  virtual void encode(strata::engine::loader& loader,
                      const std::any& value,
                      writer& out,
                      const options& options) const = 0;

  virtual std::any decode(strata::engine::loader& loader,
                          const strata::schema::type_id_t& type,
                          reader& in,
                          const options& options) const = 0;
};

using serializer_ptr = std::shared_ptr<const serializer>;

/// Serializer for a single concrete `T`; the loader only ever hands it
/// values of type `T`.
template <typename T>
class typed_serializer : public serializer {
 public:
  void encode(strata::engine::loader& loader,
              const std::any& value,
              writer& out,
              const options& options) const final {
    encode_value(loader, std::any_cast<const T&>(value), out, options);
  }

  std::any decode(strata::engine::loader& loader,
                  const strata::schema::type_id_t&,
                  reader& in,
                  const options& options) const final {
    return std::any{decode_value(loader, in, options)};
  }

 protected:
  virtual void encode_value(strata::engine::loader& loader,
                            const T& value,
                            writer& out,
                            const options& options) const = 0;

  virtual T decode_value(strata::engine::loader& loader,
                         reader& in,
                         const options& options) const = 0;
};

}  // namespace strata::codec
