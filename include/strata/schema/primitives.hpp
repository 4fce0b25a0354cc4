#pragma once
#include <any>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <variant>
#include <vector>

namespace strata::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

using type_id_t = std::type_index;
using alias_t = uint16_t;
using tag_t = uint16_t;

using boolean_t = bool;
using integer_t = int32_t;
using real_t = double;
using string_t = std::string;

/// Set elements and mapping keys.
using scalar_t = std::variant<boolean_t, integer_t, real_t, string_t>;

/// Ordered collection; each element keeps its own runtime type.
using list_t = std::vector<std::any>;

/// Positional collection. Same wire layout as list_t, distinct type.
struct tuple_t final {
  std::vector<std::any> items;
};

using set_t = std::set<scalar_t>;
using map_t = std::map<scalar_t, std::any>;

/// Fixed tags of the built-in types. Never regenerated.
enum class builtin_tag : tag_t {
  boolean = 1,
  integer = 2,
  real = 3,
  string = 4,
  list = 5,
  tuple = 6,
  set = 7,
  map = 8,
};

template <typename T>
type_id_t type_id() {
  return type_id_t{typeid(T)};
}

/// Runtime type of a value, as used for codec lookup.
type_id_t type_of(const std::any& value);

std::optional<std::string_view> builtin_name(const type_id_t& type);
std::optional<type_id_t> builtin_type(std::string_view name);

std::any to_any(const scalar_t& scalar);
std::optional<scalar_t> try_make_scalar(const std::any& value);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);

bool is_valid_utf8(const bytes_view_t& bytes);

}  // namespace strata::schema
