#include <strata/schema/class_definition.hpp>

#include <algorithm>
#include <set>
#include <utility>

namespace strata::schema {

class_definition::class_definition(type_id_t type,
                                   std::string name,
                                   factory_t factory,
                                   std::vector<field_descriptor> fields,
                                   const alias_overrides_t& alias_overrides,
                                   alias_generator_t alias_generator)
    : type_(type),
      name_(std::move(name)),
      factory_(std::move(factory)),
      fields_(std::move(fields)),
      aliases_(std::move(alias_generator)) {
  if (!factory_) {
    throw registration_error{
        fmt::format("class '{}' was registered without a factory", name_)};
  }

  auto seen = std::set<std::string_view>{};
  for (const auto& field : fields_) {
    if (!field.get || !field.set) {
      throw registration_error{fmt::format(
          "field '{}' of class '{}' has no accessor", field.name, name_)};
    }
    if (!seen.insert(field.name).second) {
      throw registration_error{fmt::format(
          "field '{}' is declared twice on class '{}'", field.name, name_)};
    }
  }

  for (const auto& [field, alias] : alias_overrides) {
    if (find_field(field) == nullptr) {
      throw registration_error{fmt::format(
          "alias override names unknown field '{}' of class '{}'", field,
          name_)};
    }
  }

  // Overrides first, in declaration order, so generated aliases step around
  // them.
  for (const auto& field : fields_) {
    if (auto it = alias_overrides.find(field.name);
        it != std::end(alias_overrides)) {
      aliases_.put(field.name, it->second);
    }
  }
  for (const auto& field : fields_) {
    aliases_.get(field.name);
  }
}

const field_descriptor* class_definition::find_field(
    const std::string_view name) const {
  auto it = std::ranges::find_if(
      fields_, [&](const field_descriptor& f) { return f.name == name; });
  return it == std::end(fields_) ? nullptr : &*it;
}

std::any class_definition::make() const {
  return factory_();
}

alias_t class_definition::alias_of(const std::string& field) const {
  auto alias = aliases_.find(field);
  if (!alias) {
    strata::common::critical("field '{}' of class '{}' has no alias", field,
                             name_);
  }
  return *alias;
}

std::optional<std::string> class_definition::field_of(
    const alias_t alias) const {
  return aliases_.find_by_identifier(alias);
}

bool class_definition::has_alias_override(const std::string& field) const {
  return aliases_.is_explicit(field);
}

void class_definition::set_alias_generator(alias_generator_t generator) {
  aliases_.set_generator(std::move(generator));
}

void class_definition::rebuild_aliases() {
  aliases_.rebuild();
}

bool class_definition::aliases_stale() const {
  return aliases_.stale();
}

}  // namespace strata::schema
