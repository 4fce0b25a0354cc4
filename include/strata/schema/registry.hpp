#pragma once
#include <strata/common/config.hpp>
#include <strata/common/error.hpp>
#include <strata/schema/class_definition.hpp>
#include <strata/schema/field.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/schema/sequence_definition.hpp>
#include <strata/schema/type_tags.hpp>
#include <concepts>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace strata::schema {

template <typename T>
class class_schema;

/// Types that declare their own schema through `static class_schema<T>
/// describe()`. Fields of such types are registered automatically.
template <typename T>
concept describable = requires {
  { T::describe() } -> std::same_as<class_schema<T>>;
};

/// Owns every class definition and sequence definition.
///
/// Registering the same type twice replaces the earlier definition (last
/// write wins); references obtained before the replacement dangle.
/// Auto-discovery of field types never replaces anything.
/// A registration that throws, including from the registration of a field
/// type, keeps the definition the type had before the call.
class registry final {
 public:
  explicit registry(type_tags& tags, const strata::config& config = {});

  registry(const registry&) = delete;
  registry& operator=(const registry&) = delete;

  /// The single registration call site; every other overload ends here.
  const class_definition& register_class(
      const type_id_t& type,
      std::string name,
      class_definition::factory_t factory,
      std::vector<field_descriptor> fields,
      const alias_overrides_t& alias_overrides = {});

  template <typename T>
  const class_definition& register_class(const class_schema<T>& schema) {
    return register_class(
        type_id<T>(), schema.name(), [] { return std::any{T{}}; },
        schema.fields(), schema.alias_overrides());
  }

  template <describable T>
  const class_definition& register_class() {
    return register_class<T>(T::describe());
  }

  /// Registers `T` when it describes itself and is neither registered nor
  /// in the middle of its own registration.
  template <typename T>
  void discover() {
    if constexpr (describable<T>) {
      const auto type = type_id<T>();
      if (!contains(type) && !in_progress_.contains(type)) {
        register_class<T>();
      }
    }
  }

  /// Records `std::vector<E>` as a sequence of `E`; idempotent. A vector
  /// element type is registered as a sequence in turn.
  template <typename E>
  const sequence_definition& register_sequence() {
    const auto type = type_id<std::vector<E>>();
    if (auto it = sequences_.find(type); it != std::end(sequences_)) {
      return it->second;
    }
    if constexpr (is_sequence_v<E>) {
      register_sequence<typename E::value_type>();
    } else {
      discover<E>();
    }
    auto [it, inserted] = sequences_.emplace(
        type, make_sequence_definition<E>("vector<" + name_of(type_id<E>()) +
                                          ">"));
    tags_.tag_of(type);
    tags_.tag_of(type_id<E>());
    return it->second;
  }

  /// Throws schema_not_found_error.
  const class_definition& get(const type_id_t& type) const;

  template <typename T>
  const class_definition& get() const {
    return get(type_id<T>());
  }

  const class_definition* find(const type_id_t& type) const;
  const sequence_definition* find_sequence(const type_id_t& type) const;

  bool contains(const type_id_t& type) const;
  size_t size() const;

  /// Registered classes in first registration order.
  const std::vector<type_id_t>& types() const { return order_; }

  /// Generator used for the aliases of every class, present and future.
  /// Existing aliases keep their values until refresh().
  void set_alias_generator(alias_generator_t generator);

  /// Regenerates every generated field alias and type tag with the current
  /// generators. Explicit aliases and tags are kept.
  void refresh();

  /// Class name, built-in name, sequence name or implementation name.
  std::string name_of(const type_id_t& type) const;

  type_tags& tags() { return tags_; }
  const type_tags& tags() const { return tags_; }
  const strata::config& config() const { return config_; }

 private:
  type_tags& tags_;
  strata::config config_;
  alias_generator_t alias_generator_;
  std::map<type_id_t, class_definition> classes_;
  std::vector<type_id_t> order_;
  std::map<type_id_t, sequence_definition> sequences_;
  std::set<type_id_t> in_progress_;
};

}  // namespace strata::schema
