#pragma once
#include <strata/schema/field.hpp>
#include <strata/schema/registry.hpp>
#include <any>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace strata::schema {

/// Declarative schema of `T`, built one member pointer at a time:
///
///   static class_schema<point> describe() {
///     return class_schema<point>{"point"}
///         .field("x", &point::x)
///         .field("y", &point::y)
///         .alias("y", 7);
///   }
///
/// Field order is the wire order.
template <typename T>
class class_schema final {
 public:
  explicit class_schema(std::string name) : name_(std::move(name)) {}

  template <typename M>
  class_schema& field(std::string name, M T::*member) {
    auto descriptor = field_descriptor{
        .name = std::move(name),
        .type = type_id<M>(),
        .get =
            [member](const std::any& object) {
              return std::any{std::any_cast<const T&>(object).*member};
            },
        .set =
            [member](std::any& object, std::any value) {
              std::any_cast<T&>(object).*member =
                  std::any_cast<M>(std::move(value));
            },
        .discover = {}};
    if constexpr (describable<M>) {
      descriptor.discover = [](registry& r) { r.discover<M>(); };
    } else if constexpr (is_sequence_v<M>) {
      descriptor.discover = [](registry& r) {
        r.register_sequence<typename M::value_type>();
      };
    }
    fields_.push_back(std::move(descriptor));
    return *this;
  }

  /// Wire token for `field` instead of a generated one.
  class_schema& alias(std::string field, alias_t alias) {
    aliases_.insert_or_assign(std::move(field), alias);
    return *this;
  }

  const std::string& name() const { return name_; }
  const std::vector<field_descriptor>& fields() const { return fields_; }
  const alias_overrides_t& alias_overrides() const { return aliases_; }

 private:
  std::string name_;
  std::vector<field_descriptor> fields_;
  alias_overrides_t aliases_;
};

}  // namespace strata::schema
