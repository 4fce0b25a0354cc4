#include <spdlog/spdlog.h>
#include <strata/schema/type_tags.hpp>

namespace strata::schema {

namespace {

void bind_builtins(type_tags::registry_t& registry) {
  registry.put(type_id<boolean_t>(), static_cast<tag_t>(builtin_tag::boolean));
  registry.put(type_id<integer_t>(), static_cast<tag_t>(builtin_tag::integer));
  registry.put(type_id<real_t>(), static_cast<tag_t>(builtin_tag::real));
  registry.put(type_id<string_t>(), static_cast<tag_t>(builtin_tag::string));
  registry.put(type_id<list_t>(), static_cast<tag_t>(builtin_tag::list));
  registry.put(type_id<tuple_t>(), static_cast<tag_t>(builtin_tag::tuple));
  registry.put(type_id<set_t>(), static_cast<tag_t>(builtin_tag::set));
  registry.put(type_id<map_t>(), static_cast<tag_t>(builtin_tag::map));
}

}  // namespace

type_tags::type_tags(const strata::config& config)
    : registry_(make_counter_generator<type_id_t, tag_t>(config.tag_base)) {
  bind_builtins(registry_);
}

tag_t type_tags::tag_of(const type_id_t& type) {
  if (auto existing = registry_.find(type)) {
    return *existing;
  }
  auto tag = registry_.get(type);
  spdlog::debug("Assigned type tag {} to '{}'", tag, type.name());
  return tag;
}

type_id_t type_tags::type_of(const tag_t tag) const {
  auto type = registry_.find_by_identifier(tag);
  if (!type) {
    throw unknown_type_tag_error{
        fmt::format("type tag {} is not registered", tag), tag};
  }
  return *type;
}

std::optional<type_id_t> type_tags::find_type(const tag_t tag) const {
  return registry_.find_by_identifier(tag);
}

std::optional<tag_t> type_tags::find_tag(const type_id_t& type) const {
  return registry_.find(type);
}

void type_tags::put(const type_id_t& type, const tag_t tag) {
  registry_.put(type, tag);
  spdlog::debug("Bound type tag {} to '{}' explicitly", tag, type.name());
}

void type_tags::set_generator(generator_t generator) {
  registry_.set_generator(std::move(generator));
  spdlog::warn(
      "Type tag generator replaced; {} cached tag(s) keep their values until "
      "rebuild()",
      registry_.size());
}

void type_tags::rebuild() {
  registry_.rebuild();
  spdlog::info("Rebuilt type tag registry with {} tag(s)", registry_.size());
}

bool type_tags::stale() const {
  return registry_.stale();
}

bool type_tags::contains(const type_id_t& type) const {
  return registry_.contains(type);
}

size_t type_tags::size() const {
  return registry_.size();
}

std::vector<std::pair<type_id_t, tag_t>> type_tags::entries() const {
  return registry_.entries();
}

}  // namespace strata::schema
