#include <gtest/gtest.h>
#include <strata/common/error.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/testing/common.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <string_view>

using namespace strata::schema;
using namespace strata::testing;

namespace {

template <typename T>
T round_trip(engine_fixture& fixture, const T& value) {
  auto encoded = fixture.loader.serialize(std::any{value});
  return fixture.loader.deserialize<T>(make_bytes_view(encoded));
}

}  // namespace

TEST(builtin_codecs, integer_layout) {
  auto fixture = engine_fixture{};
  EXPECT_EQ(fixture.loader.serialize(std::any{integer_t{1}}),
            bytes({0x00, 0x00, 0x00, 0x01}));
  EXPECT_EQ(fixture.loader.serialize(std::any{integer_t{-1}}),
            bytes({0xFF, 0xFF, 0xFF, 0xFF}));

  auto zero = bytes({0x00, 0x00, 0x00, 0x00});
  EXPECT_EQ(fixture.loader.deserialize<integer_t>(make_bytes_view(zero)), 0);
}

TEST(builtin_codecs, integer_round_trips_extremes) {
  auto fixture = engine_fixture{};
  for (const auto value : {std::numeric_limits<integer_t>::min(), integer_t{-42},
                           integer_t{0},
                           std::numeric_limits<integer_t>::max()}) {
    EXPECT_EQ(round_trip(fixture, value), value);
  }
}

TEST(builtin_codecs, boolean_layout) {
  auto fixture = engine_fixture{};
  EXPECT_EQ(fixture.loader.serialize(std::any{true}), bytes({0x01}));
  EXPECT_EQ(fixture.loader.serialize(std::any{false}), bytes({0x00}));
  EXPECT_TRUE(round_trip(fixture, true));
  EXPECT_FALSE(round_trip(fixture, false));
}

TEST(builtin_codecs, boolean_rejects_other_bytes) {
  auto fixture = engine_fixture{};
  auto data = bytes({0x02});
  EXPECT_THROW(fixture.loader.deserialize<boolean_t>(make_bytes_view(data)),
               strata::malformed_stream_error);
}

TEST(builtin_codecs, real_round_trips_special_values) {
  auto fixture = engine_fixture{};
  EXPECT_EQ(fixture.loader.serialize(std::any{real_t{-2.0}}),
            bytes({0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
  EXPECT_EQ(round_trip(fixture, real_t{3.141592653589793}), 3.141592653589793);
  EXPECT_EQ(round_trip(fixture, std::numeric_limits<real_t>::infinity()),
            std::numeric_limits<real_t>::infinity());
  EXPECT_TRUE(
      std::isnan(round_trip(fixture, std::numeric_limits<real_t>::quiet_NaN())));
  EXPECT_TRUE(std::signbit(round_trip(fixture, real_t{-0.0})));
}

TEST(builtin_codecs, string_layout) {
  auto fixture = engine_fixture{};
  EXPECT_EQ(fixture.loader.serialize(std::any{string_t{"ab"}}),
            bytes({0x00, 0x00, 0x00, 0x02, 'a', 'b'}));
  EXPECT_EQ(fixture.loader.serialize(std::any{string_t{}}),
            bytes({0x00, 0x00, 0x00, 0x00}));
}

TEST(builtin_codecs, string_round_trips_unicode) {
  auto fixture = engine_fixture{};
  const auto text = string_t{"h\xc3\xa9llo w\xc3\xb6rld \xe2\x9c\x93"};
  EXPECT_EQ(round_trip(fixture, text), text);
  EXPECT_EQ(round_trip(fixture, string_t{}), "");
}

TEST(builtin_codecs, string_rejects_invalid_utf8) {
  auto fixture = engine_fixture{};
  auto data = bytes({0x00, 0x00, 0x00, 0x01, 0xFF});
  EXPECT_THROW(fixture.loader.deserialize<string_t>(make_bytes_view(data)),
               strata::malformed_stream_error);
}

TEST(builtin_codecs, string_validation_can_be_disabled) {
  auto config = strata::config{};
  config.validate_utf8 = false;
  auto fixture = engine_fixture{config};
  auto data = bytes({0x00, 0x00, 0x00, 0x01, 0xFF});
  EXPECT_EQ(fixture.loader.deserialize<string_t>(make_bytes_view(data)),
            std::string(1, '\xFF'));
}

TEST(builtin_codecs, string_length_past_limit_is_malformed) {
  auto config = strata::config{};
  config.max_length = 3;
  auto fixture = engine_fixture{config};
  auto data = bytes({0x00, 0x00, 0x00, 0x04, 'a', 'b', 'c', 'd'});
  EXPECT_THROW(fixture.loader.deserialize<string_t>(make_bytes_view(data)),
               strata::malformed_stream_error);
}

TEST(builtin_codecs, list_tags_each_element) {
  auto fixture = engine_fixture{};
  auto value = list_t{integer_t{1}, string_t{"a"}, true};
  EXPECT_EQ(fixture.loader.serialize(std::any{value}),
            bytes({0x00, 0x00, 0x00, 0x03,                          // count
                   0x00, 0x02, 0x00, 0x00, 0x00, 0x01,              // int 1
                   0x00, 0x04, 0x00, 0x00, 0x00, 0x01, 'a',         // str a
                   0x00, 0x01, 0x01}));                             // true
}

TEST(builtin_codecs, list_round_trips_nested_heterogeneous_items) {
  auto fixture = engine_fixture{};
  auto value = list_t{integer_t{1}, list_t{string_t{"x"}, real_t{0.5}},
                      tuple_t{{false}}, list_t{}};
  auto decoded = round_trip(fixture, value);
  ASSERT_EQ(decoded.size(), 4u);
  EXPECT_EQ(std::any_cast<integer_t>(decoded[0]), 1);
  const auto& nested = std::any_cast<const list_t&>(decoded[1]);
  ASSERT_EQ(nested.size(), 2u);
  EXPECT_EQ(std::any_cast<string_t>(nested[0]), "x");
  EXPECT_EQ(std::any_cast<real_t>(nested[1]), 0.5);
  const auto& tuple = std::any_cast<const tuple_t&>(decoded[2]);
  ASSERT_EQ(tuple.items.size(), 1u);
  EXPECT_FALSE(std::any_cast<boolean_t>(tuple.items[0]));
  EXPECT_TRUE(std::any_cast<const list_t&>(decoded[3]).empty());
}

TEST(builtin_codecs, tuple_and_list_share_layout) {
  auto fixture = engine_fixture{};
  auto items = std::vector<std::any>{integer_t{5}, string_t{"z"}};
  EXPECT_EQ(fixture.loader.serialize(std::any{list_t(items)}),
            fixture.loader.serialize(std::any{tuple_t{items}}));
}

TEST(builtin_codecs, set_round_trips) {
  auto fixture = engine_fixture{};
  auto value = set_t{integer_t{3}, string_t{"b"}, true, real_t{1.25}};
  EXPECT_EQ(round_trip(fixture, value), value);
  EXPECT_EQ(round_trip(fixture, set_t{}), set_t{});
}

TEST(builtin_codecs, set_rejects_duplicates) {
  auto fixture = engine_fixture{};
  auto data = bytes({0x00, 0x00, 0x00, 0x02,              // count
                     0x00, 0x02, 0x00, 0x00, 0x00, 0x07,  // int 7
                     0x00, 0x02, 0x00, 0x00, 0x00, 0x07});
  EXPECT_THROW(fixture.loader.deserialize<set_t>(make_bytes_view(data)),
               strata::malformed_stream_error);
}

TEST(builtin_codecs, set_rejects_non_scalar_elements) {
  auto fixture = engine_fixture{};
  auto data = bytes({0x00, 0x00, 0x00, 0x01,  // count
                     0x00, 0x05, 0x00, 0x00, 0x00, 0x00});
  EXPECT_THROW(fixture.loader.deserialize<set_t>(make_bytes_view(data)),
               strata::malformed_stream_error);
}

TEST(builtin_codecs, map_round_trips) {
  auto fixture = engine_fixture{};
  auto value = map_t{{string_t{"name"}, string_t{"strata"}},
                     {integer_t{2}, list_t{integer_t{1}, integer_t{2}}},
                     {false, map_t{}}};
  auto decoded = round_trip(fixture, value);
  ASSERT_EQ(decoded.size(), 3u);
  EXPECT_EQ(std::any_cast<string_t>(decoded.at(string_t{"name"})), "strata");
  EXPECT_EQ(std::any_cast<const list_t&>(decoded.at(integer_t{2})).size(), 2u);
  EXPECT_TRUE(std::any_cast<const map_t&>(decoded.at(false)).empty());
}

TEST(builtin_codecs, map_layout) {
  auto fixture = engine_fixture{};
  auto value = map_t{{string_t{"k"}, integer_t{9}}};
  EXPECT_EQ(fixture.loader.serialize(std::any{value}),
            bytes({0x00, 0x00, 0x00, 0x01,                   // count
                   0x00, 0x04, 0x00, 0x00, 0x00, 0x01, 'k',  // str k
                   0x00, 0x02, 0x00, 0x00, 0x00, 0x09}));    // int 9
}

TEST(builtin_codecs, map_rejects_duplicate_keys) {
  auto fixture = engine_fixture{};
  auto data = bytes({0x00, 0x00, 0x00, 0x02,              // count
                     0x00, 0x01, 0x01,                    // true
                     0x00, 0x02, 0x00, 0x00, 0x00, 0x01,  // int 1
                     0x00, 0x01, 0x01,                    // true
                     0x00, 0x02, 0x00, 0x00, 0x00, 0x02});
  EXPECT_THROW(fixture.loader.deserialize<map_t>(make_bytes_view(data)),
               strata::malformed_stream_error);
}

TEST(builtin_codecs, container_count_past_remaining_bytes_is_malformed) {
  auto fixture = engine_fixture{};
  auto data = bytes({0x7F, 0xFF, 0xFF, 0xFF, 0x00, 0x02});
  EXPECT_THROW(fixture.loader.deserialize<list_t>(make_bytes_view(data)),
               strata::malformed_stream_error);
}

TEST(builtin_codecs, element_with_unknown_tag_is_rejected) {
  auto fixture = engine_fixture{};
  auto data = bytes({0x00, 0x00, 0x00, 0x01, 0x12, 0x34, 0x00});
  EXPECT_THROW(fixture.loader.deserialize<list_t>(make_bytes_view(data)),
               strata::unknown_type_tag_error);
}
