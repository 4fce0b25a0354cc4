#pragma once
#include <strata/codec/serializer.hpp>
#include <strata/schema/primitives.hpp>
#include <map>
#include <utility>

namespace strata::codec {

/// Exact type -> codec. The last codec put for a type wins.
class serializer_registry final {
 public:
  /// Registry holding the built-in codecs for bool, int, float, str, list,
  /// tuple, set and map.
  static serializer_registry make_default();

  void put(const strata::schema::type_id_t& type, serializer_ptr serializer);

  template <typename T>
  void put(serializer_ptr serializer) {
    put(strata::schema::type_id<T>(), std::move(serializer));
  }

  const serializer* find(const strata::schema::type_id_t& type) const;
  bool contains(const strata::schema::type_id_t& type) const;
  bool remove(const strata::schema::type_id_t& type);
  size_t size() const { return serializers_.size(); }

 private:
  std::map<strata::schema::type_id_t, serializer_ptr> serializers_;
};

}  // namespace strata::codec
