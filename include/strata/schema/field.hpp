#pragma once
#include <strata/schema/primitives.hpp>
#include <any>
#include <functional>
#include <string>

namespace strata::schema {

class registry;

/// One declared field of a class definition.
///
/// `get` copies the field out of an instance, `set` moves a decoded value of
/// the declared type into it. `discover`, when present, registers the
/// declared type (or the element type of a declared sequence) with the
/// registry that is registering the owning class.
struct field_descriptor final {
  std::string name;
  type_id_t type;
  std::function<std::any(const std::any& object)> get;
  std::function<void(std::any& object, std::any value)> set;
  std::function<void(registry& registry)> discover;
};

}  // namespace strata::schema
