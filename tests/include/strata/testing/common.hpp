#pragma once

#include <strata/codec/serializer.hpp>
#include <strata/common/config.hpp>
#include <strata/engine/loader.hpp>
#include <strata/schema/describe.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/schema/registry.hpp>
#include <strata/schema/type_tags.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace strata::testing {

using strata::schema::class_schema;

struct point final {
  strata::schema::integer_t x{};
  strata::schema::integer_t y{};

  bool operator==(const point&) const = default;

  static class_schema<point> describe() {
    return class_schema<point>{"point"}
        .field("x", &point::x)
        .field("y", &point::y);
  }
};

struct inner final {
  strata::schema::integer_t y{};

  bool operator==(const inner&) const = default;

  static class_schema<inner> describe() {
    return class_schema<inner>{"inner"}.field("y", &inner::y);
  }
};

/// Holds a describable field, so registering it discovers `inner`.
struct outer final {
  strata::schema::integer_t x{};
  inner b;

  bool operator==(const outer&) const = default;

  static class_schema<outer> describe() {
    return class_schema<outer>{"outer"}
        .field("x", &outer::x)
        .field("b", &outer::b);
  }
};

/// Registered by hand in tests, never self-described.
struct single final {
  strata::schema::integer_t test{1};
};

struct profile final {
  strata::schema::boolean_t active{};
  strata::schema::integer_t age{};
  strata::schema::real_t score{};
  strata::schema::string_t name;
  strata::schema::list_t history;
  strata::schema::map_t attributes;
  strata::schema::set_t labels;
  std::vector<point> waypoints;

  static class_schema<profile> describe() {
    return class_schema<profile>{"profile"}
        .field("active", &profile::active)
        .field("age", &profile::age)
        .field("score", &profile::score)
        .field("name", &profile::name)
        .field("history", &profile::history)
        .field("attributes", &profile::attributes)
        .field("labels", &profile::labels)
        .field("waypoints", &profile::waypoints);
  }
};

struct empty final {
  static class_schema<empty> describe() {
    return class_schema<empty>{"empty"};
  }
};

// `team` and `member` reference each other through vectors; registering
// either must terminate.
struct team;

struct member final {
  strata::schema::string_t name;
  std::vector<team> teams;

  static class_schema<member> describe();
};

struct team final {
  strata::schema::string_t title;
  std::vector<member> members;

  static class_schema<team> describe();
};

inline class_schema<member> member::describe() {
  return class_schema<member>{"member"}
      .field("name", &member::name)
      .field("teams", &member::teams);
}

inline class_schema<team> team::describe() {
  return class_schema<team>{"team"}
      .field("title", &team::title)
      .field("members", &team::members);
}

/// Not registered anywhere.
struct unregistered final {
  int value{};
};

/// Written by `rgb_serializer` as three raw bytes.
struct rgb final {
  uint8_t r{};
  uint8_t g{};
  uint8_t b{};

  bool operator==(const rgb&) const = default;
};

class rgb_serializer final : public strata::codec::typed_serializer<rgb> {
 protected:
  void encode_value(strata::engine::loader&,
                    const rgb& value,
                    strata::codec::writer& out,
                    const strata::codec::options&) const override {
    out.write(value.r).write(value.g).write(value.b);
  }

  rgb decode_value(strata::engine::loader&,
                   strata::codec::reader& in,
                   const strata::codec::options&) const override {
    auto out = rgb{};
    out.r = in.read_u8();
    out.g = in.read_u8();
    out.b = in.read_u8();
    return out;
  }
};

/// Fresh tag registry, schema registry and loader per test.
struct engine_fixture {
  explicit engine_fixture(const strata::config& config = {})
      : tags(config), schemas(tags, config), loader(schemas) {}

  strata::schema::type_tags tags;
  strata::schema::registry schemas;
  strata::engine::loader loader;
};

inline strata::schema::bytes_t bytes(std::initializer_list<uint8_t> values) {
  return strata::schema::bytes_t{values};
}

inline std::filesystem::path make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         (std::string{prefix} + "_" +
          std::to_string(static_cast<unsigned long long>(now)));
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace strata::testing
