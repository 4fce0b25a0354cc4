#pragma once
#include <strata/schema/primitives.hpp>
#include <any>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace strata::schema {

namespace detail {

template <typename M>
struct is_vector : std::false_type {};

template <typename E, typename A>
struct is_vector<std::vector<E, A>> : std::true_type {};

}  // namespace detail

/// `std::vector<E>` other than the built-in list_t.
template <typename M>
inline constexpr bool is_sequence_v =
    detail::is_vector<M>::value && !std::is_same_v<M, list_t>;

/// Registered homogeneous `std::vector<E>`. Elements are written without
/// tags since their type is fixed by `element_type`.
struct sequence_definition final {
  type_id_t type;
  type_id_t element_type;
  std::string name;
  std::function<std::any()> make;
  std::function<size_t(const std::any& sequence)> size;
  std::function<std::any(const std::any& sequence, size_t index)> element;
  std::function<void(std::any& sequence, std::any element)> append;
};

template <typename E>
sequence_definition make_sequence_definition(std::string name) {
  static_assert(!std::is_same_v<E, std::any>,
                "std::vector<std::any> is the built-in list_t");
  using sequence_t = std::vector<E>;
  return sequence_definition{
      .type = type_id<sequence_t>(),
      .element_type = type_id<E>(),
      .name = std::move(name),
      .make = [] { return std::any{sequence_t{}}; },
      .size =
          [](const std::any& sequence) {
            return std::any_cast<const sequence_t&>(sequence).size();
          },
      .element =
          [](const std::any& sequence, const size_t index) {
            return std::any{static_cast<E>(
                std::any_cast<const sequence_t&>(sequence)[index])};
          },
      .append =
          [](std::any& sequence, std::any element) {
            std::any_cast<sequence_t&>(sequence).push_back(
                std::any_cast<E>(std::move(element)));
          }};
}

}  // namespace strata::schema
