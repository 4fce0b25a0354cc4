#include <spdlog/spdlog.h>
#include <strata/schema/registry.hpp>

#include <optional>
#include <utility>

namespace strata::schema {

namespace {

// Keeps a type in the in-progress set for the lifetime of one registration,
// including when a discovered field type throws.
struct registration_guard final {
  registration_guard(std::set<type_id_t>& in_progress, const type_id_t& type)
      : in_progress_(in_progress), type_(type) {
    in_progress_.insert(type_);
  }
  ~registration_guard() { in_progress_.erase(type_); }

  registration_guard(const registration_guard&) = delete;
  registration_guard& operator=(const registration_guard&) = delete;

  std::set<type_id_t>& in_progress_;
  type_id_t type_;
};

}  // namespace

registry::registry(type_tags& tags, const strata::config& config)
    : tags_(tags),
      config_(config),
      alias_generator_(
          make_counter_generator<std::string, alias_t>(config.alias_base)) {}

const class_definition& registry::register_class(
    const type_id_t& type,
    std::string name,
    class_definition::factory_t factory,
    std::vector<field_descriptor> fields,
    const alias_overrides_t& alias_overrides) {
  if (in_progress_.contains(type)) {
    return classes_.at(type);
  }

  // Built before any state changes so a rejected definition leaves the
  // registry as it was.
  auto definition =
      class_definition{type,           std::move(name),  std::move(factory),
                       std::move(fields), alias_overrides, alias_generator_};

  auto previous = std::optional<class_definition>{};
  if (auto it = classes_.find(type); it != std::end(classes_)) {
    spdlog::warn("Class '{}' registered again; replacing its definition",
                 definition.name());
    previous = std::move(it->second);
    it->second = std::move(definition);
  } else {
    classes_.emplace(type, std::move(definition));
    order_.push_back(type);
  }
  const auto& registered = classes_.at(type);

  // A field type that fails to register restores the previous definition.
  // Tags already assigned and classes discovered before the failure stay.
  try {
    tags_.tag_of(type);
    auto guard = registration_guard{in_progress_, type};
    for (const auto& field : registered.fields()) {
      tags_.tag_of(field.type);
      if (field.discover) {
        field.discover(*this);
      }
    }
  } catch (...) {
    if (previous) {
      classes_.at(type) = std::move(*previous);
    } else {
      classes_.erase(type);
      std::erase(order_, type);
    }
    throw;
  }

  spdlog::debug("Registered class '{}' with {} field(s)", registered.name(),
                registered.field_count());
  return registered;
}

const class_definition& registry::get(const type_id_t& type) const {
  const auto* definition = find(type);
  if (definition == nullptr) {
    throw schema_not_found_error{
        fmt::format("no class definition registered for '{}'", name_of(type))};
  }
  return *definition;
}

const class_definition* registry::find(const type_id_t& type) const {
  auto it = classes_.find(type);
  return it == std::end(classes_) ? nullptr : &it->second;
}

const sequence_definition* registry::find_sequence(
    const type_id_t& type) const {
  auto it = sequences_.find(type);
  return it == std::end(sequences_) ? nullptr : &it->second;
}

bool registry::contains(const type_id_t& type) const {
  return classes_.contains(type);
}

size_t registry::size() const {
  return classes_.size();
}

void registry::set_alias_generator(alias_generator_t generator) {
  alias_generator_ = generator;
  for (auto& [type, definition] : classes_) {
    definition.set_alias_generator(generator);
  }
  spdlog::warn(
      "Field alias generator replaced; existing aliases keep their values "
      "until refresh()");
}

void registry::refresh() {
  for (const auto& type : order_) {
    classes_.at(type).rebuild_aliases();
  }
  tags_.rebuild();
  spdlog::info("Refreshed aliases of {} class(es)", order_.size());
}

std::string registry::name_of(const type_id_t& type) const {
  if (const auto* definition = find(type)) {
    return definition->name();
  }
  if (const auto* sequence = find_sequence(type)) {
    return sequence->name;
  }
  if (auto builtin = builtin_name(type)) {
    return std::string{*builtin};
  }
  return type.name();
}

}  // namespace strata::schema
