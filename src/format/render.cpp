#include <spdlog/spdlog.h>
#include <strata/format/render.hpp>

#include <iterator>
#include <string_view>
#include <vector>

using namespace strata::schema;

namespace strata::format {

namespace {

std::string quote(const std::string_view text) {
  auto out = std::string{"\""};
  for (const auto ch : text) {
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(ch);
    }
  }
  out.push_back('"');
  return out;
}

template <typename Range, typename Render>
std::string join(const Range& range, Render&& render_item) {
  auto out = std::string{};
  auto first = true;
  for (const auto& item : range) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += render_item(item);
  }
  return out;
}

}  // namespace

std::string render(const registry& schemas, const std::any& value) {
  if (!value.has_value()) {
    return "<empty>";
  }
  if (const auto* b = std::any_cast<boolean_t>(&value)) {
    return *b ? "true" : "false";
  }
  if (const auto* i = std::any_cast<integer_t>(&value)) {
    return fmt::format("{}", *i);
  }
  if (const auto* r = std::any_cast<real_t>(&value)) {
    return fmt::format("{}", *r);
  }
  if (const auto* s = std::any_cast<string_t>(&value)) {
    return quote(*s);
  }

  auto render_any = [&](const std::any& item) { return render(schemas, item); };
  auto render_scalar = [&](const scalar_t& scalar) {
    return render(schemas, to_any(scalar));
  };

  if (const auto* list = std::any_cast<list_t>(&value)) {
    return "[" + join(*list, render_any) + "]";
  }
  if (const auto* tuple = std::any_cast<tuple_t>(&value)) {
    return "(" + join(tuple->items, render_any) + ")";
  }
  if (const auto* set = std::any_cast<set_t>(&value)) {
    return "{" + join(*set, render_scalar) + "}";
  }
  if (const auto* map = std::any_cast<map_t>(&value)) {
    return "{" +
           join(*map,
                [&](const auto& entry) {
                  return render_scalar(entry.first) + ": " +
                         render_any(entry.second);
                }) +
           "}";
  }

  const auto type = type_of(value);
  if (const auto* definition = schemas.find(type)) {
    return definition->name() + "{" +
           join(definition->fields(),
                [&](const field_descriptor& field) {
                  return field.name + "=" + render_any(field.get(value));
                }) +
           "}";
  }
  if (const auto* sequence = schemas.find_sequence(type)) {
    auto items = std::vector<std::any>{};
    const auto size = sequence->size(value);
    items.reserve(size);
    for (size_t i = 0; i < size; ++i) {
      items.push_back(sequence->element(value, i));
    }
    return "[" + join(items, render_any) + "]";
  }
  return "<" + schemas.name_of(type) + ">";
}

}  // namespace strata::format
