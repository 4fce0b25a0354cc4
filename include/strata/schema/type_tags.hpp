#pragma once
#include <strata/common/config.hpp>
#include <strata/common/error.hpp>
#include <strata/schema/identifier_registry.hpp>
#include <strata/schema/primitives.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace strata::schema {

/// Global type <-> tag mapping used by tagging mode and by the per-element
/// tags of the heterogeneous containers.
///
/// The built-in types are bound explicitly to `builtin_tag` values and never
/// move. Every other type receives the next counter value, starting at
/// `config::tag_base`, the first time it is tagged.
class type_tags final {
 public:
  using registry_t =
      identifier_registry<type_id_t, tag_t, type_tag_conflict_error>;
  using generator_t = registry_t::generator_t;

  explicit type_tags(const strata::config& config = {});

  /// Tag of `type`, assigning the next generated tag on first use.
  tag_t tag_of(const type_id_t& type);

  template <typename T>
  tag_t tag_of() {
    return tag_of(type_id<T>());
  }

  /// Throws unknown_type_tag_error when nothing is bound to `tag`.
  type_id_t type_of(tag_t tag) const;

  std::optional<type_id_t> find_type(tag_t tag) const;
  std::optional<tag_t> find_tag(const type_id_t& type) const;

  /// Explicit binding; throws type_tag_conflict_error when `tag` is taken.
  void put(const type_id_t& type, tag_t tag);

  /// Cached tags keep their values until rebuild() runs.
  void set_generator(generator_t generator);
  void rebuild();

  bool stale() const;
  bool contains(const type_id_t& type) const;
  size_t size() const;
  std::vector<std::pair<type_id_t, tag_t>> entries() const;

 private:
  registry_t registry_;
};

}  // namespace strata::schema
