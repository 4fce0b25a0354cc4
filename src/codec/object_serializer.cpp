#include <strata/codec/object_serializer.hpp>
#include <strata/common/error.hpp>
#include <strata/engine/loader.hpp>

#include <set>
#include <utility>

using namespace strata::schema;

namespace strata::codec {

void object_serializer::encode(strata::engine::loader& loader,
                               const std::any& value,
                               writer& out,
                               const options& options) const {
  const auto& definition = loader.schemas().get(type_of(value));
  for (const auto& field : definition.fields()) {
    out.write(definition.alias_of(field.name));
    loader.serialize(field.get(value), out, options);
  }
}

std::any object_serializer::decode(strata::engine::loader& loader,
                                   const type_id_t& type,
                                   reader& in,
                                   const options& options) const {
  const auto& definition = loader.schemas().get(type);
  auto object = definition.make();
  auto seen = std::set<alias_t>{};
  for (size_t i = 0; i < definition.field_count(); ++i) {
    const auto offset = in.position();
    const auto alias = in.read_u16();
    auto name = definition.field_of(alias);
    if (!name) {
      throw malformed_stream_error{
          fmt::format("unknown field alias {} for class '{}' at offset {}",
                      alias, definition.name(), offset)};
    }
    if (!seen.insert(alias).second) {
      throw malformed_stream_error{
          fmt::format("field '{}' of class '{}' appears twice at offset {}",
                      *name, definition.name(), offset)};
    }
    const auto* field = definition.find_field(*name);
    field->set(object, loader.deserialize(in, field->type, options));
  }
  return object;
}

}  // namespace strata::codec
