#pragma once

#include <strata/codec/object_serializer.hpp>
#include <strata/codec/reader.hpp>
#include <strata/codec/sequence_serializer.hpp>
#include <strata/codec/serializer.hpp>
#include <strata/codec/serializer_registry.hpp>
#include <strata/codec/writer.hpp>
#include <strata/common/config.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/schema/registry.hpp>
#include <strata/schema/type_tags.hpp>
#include <any>
#include <filesystem>
#include <optional>
#include <utility>

namespace strata::engine {

/// Encode/decode dispatch engine.
///
/// A loader references the schema registry (and through it the type tag
/// registry) it was built with and owns its serializer registry. Codecs are
/// resolved by the exact runtime type of a value: a registered serializer
/// first, then the default schema codec for registered classes, then the
/// default sequence codec for registered `std::vector<E>` types.
///
/// Encoding recurses once per level of the value graph. Cycles cannot be
/// expressed with value types; a custom codec that introduces one recurses
/// until the stack runs out.
class loader final {
 public:
  /// Loader with the built-in codecs.
  explicit loader(strata::schema::registry& schemas);

  loader(strata::schema::registry& schemas,
         strata::codec::serializer_registry serializers);

  loader(const loader&) = delete;
  loader& operator=(const loader&) = delete;

  /// Encode `value`. With `options.tagging` the output starts with the type
  /// tag of `value`.
  strata::schema::bytes_t serialize(const std::any& value,
                                    const strata::codec::options& options = {});

  /// Append the encoding of `value` to `out`. A failed top-level call leaves
  /// `out` as it was.
  void serialize(const std::any& value,
                 strata::codec::writer& out,
                 const strata::codec::options& options = {});

  /// Decode one value from the front of `bytes`. `type` is required unless
  /// the stream is tagged; when both are present they must agree.
  std::any deserialize(strata::schema::bytes_view_t bytes,
                       std::optional<strata::schema::type_id_t> type,
                       const strata::codec::options& options = {});

  /// Decode one value at the reader's position. A failed top-level call
  /// leaves the reader where it was.
  std::any deserialize(strata::codec::reader& in,
                       std::optional<strata::schema::type_id_t> type,
                       const strata::codec::options& options = {});

  template <typename T>
  T deserialize(strata::schema::bytes_view_t bytes,
                const strata::codec::options& options = {}) {
    return std::any_cast<T>(
        deserialize(bytes, strata::schema::type_id<T>(), options));
  }

  /// Tag of the runtime type of `value`, then `value`. Used by the
  /// heterogeneous containers for each of their elements.
  void serialize_element(const std::any& value,
                         strata::codec::writer& out,
                         const strata::codec::options& options);

  std::any deserialize_element(strata::codec::reader& in,
                               const strata::codec::options& options);

  /// Replaces any codec previously registered for `type`.
  void register_serializer(const strata::schema::type_id_t& type,
                           strata::codec::serializer_ptr serializer);

  template <typename T>
  void register_serializer(strata::codec::serializer_ptr serializer) {
    register_serializer(strata::schema::type_id<T>(), std::move(serializer));
  }

  /// Throws unregistered_type_error when nothing can code `type`.
  const strata::codec::serializer& resolve(
      const strata::schema::type_id_t& type) const;

  bool can_resolve(const strata::schema::type_id_t& type) const;

  /// Write the encoding of `value` to `path`, replacing the file.
  void write(const std::filesystem::path& path,
             const std::any& value,
             const strata::codec::options& options = {});

  /// Read exactly one value from `path`; trailing bytes are malformed.
  std::any read(const std::filesystem::path& path,
                std::optional<strata::schema::type_id_t> type,
                const strata::codec::options& options = {});

  template <typename T>
  T read(const std::filesystem::path& path,
         const strata::codec::options& options = {}) {
    return std::any_cast<T>(read(path, strata::schema::type_id<T>(), options));
  }

  strata::schema::registry& schemas() { return schemas_; }
  const strata::schema::registry& schemas() const { return schemas_; }
  strata::schema::type_tags& tags() { return schemas_.tags(); }
  const strata::schema::type_tags& tags() const { return schemas_.tags(); }
  const strata::codec::serializer_registry& serializers() const {
    return serializers_;
  }
  const strata::config& config() const { return schemas_.config(); }

 private:
  strata::schema::registry& schemas_;
  strata::codec::serializer_registry serializers_;
  strata::codec::object_serializer object_serializer_;
  strata::codec::sequence_serializer sequence_serializer_;
};

}  // namespace strata::engine
