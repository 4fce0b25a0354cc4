#pragma once
#include <strata/common/config.hpp>
#include <strata/common/error.hpp>
#include <strata/schema/field.hpp>
#include <strata/schema/identifier_registry.hpp>
#include <strata/schema/primitives.hpp>
#include <any>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::schema {

using alias_registry_t =
    identifier_registry<std::string, alias_t, field_alias_conflict_error>;
using alias_generator_t = alias_registry_t::generator_t;
using alias_overrides_t = std::map<std::string, alias_t>;

/// Registered layout of a class: its fields in declaration order, the
/// factory producing a default instance, and the field alias registry.
///
/// Every field has an alias as soon as the definition exists. Overrides are
/// bound first, then the remaining fields receive generated aliases in
/// declaration order.
class class_definition final {
 public:
  using factory_t = std::function<std::any()>;

  class_definition(type_id_t type,
                   std::string name,
                   factory_t factory,
                   std::vector<field_descriptor> fields,
                   const alias_overrides_t& alias_overrides,
                   alias_generator_t alias_generator);

  const type_id_t& type() const { return type_; }
  const std::string& name() const { return name_; }
  const std::vector<field_descriptor>& fields() const { return fields_; }
  size_t field_count() const { return fields_.size(); }

  const field_descriptor* find_field(std::string_view name) const;

  /// Default constructed instance of the class.
  std::any make() const;

  alias_t alias_of(const std::string& field) const;
  std::optional<std::string> field_of(alias_t alias) const;
  bool has_alias_override(const std::string& field) const;

  /// Replaces the generator; aliases stay as they are until
  /// rebuild_aliases().
  void set_alias_generator(alias_generator_t generator);
  void rebuild_aliases();
  bool aliases_stale() const;

 private:
  type_id_t type_;
  std::string name_;
  factory_t factory_;
  std::vector<field_descriptor> fields_;
  alias_registry_t aliases_;
};

}  // namespace strata::schema
