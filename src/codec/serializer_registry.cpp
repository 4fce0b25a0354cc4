#include <strata/codec/builtin.hpp>
#include <strata/codec/serializer_registry.hpp>
#include <strata/common/error.hpp>

#include <memory>

using namespace strata::schema;

namespace strata::codec {

serializer_registry serializer_registry::make_default() {
  auto registry = serializer_registry{};
  registry.put<boolean_t>(std::make_shared<boolean_serializer>());
  registry.put<integer_t>(std::make_shared<integer_serializer>());
  registry.put<real_t>(std::make_shared<real_serializer>());
  registry.put<string_t>(std::make_shared<string_serializer>());
  registry.put<list_t>(std::make_shared<list_serializer>());
  registry.put<tuple_t>(std::make_shared<tuple_serializer>());
  registry.put<set_t>(std::make_shared<set_serializer>());
  registry.put<map_t>(std::make_shared<map_serializer>());
  return registry;
}

void serializer_registry::put(const type_id_t& type,
                              serializer_ptr serializer) {
  if (!serializer) {
    throw registration_error{
        fmt::format("null serializer registered for '{}'", type.name())};
  }
  serializers_.insert_or_assign(type, std::move(serializer));
}

const serializer* serializer_registry::find(const type_id_t& type) const {
  auto it = serializers_.find(type);
  return it == std::end(serializers_) ? nullptr : it->second.get();
}

bool serializer_registry::contains(const type_id_t& type) const {
  return serializers_.contains(type);
}

bool serializer_registry::remove(const type_id_t& type) {
  return serializers_.erase(type) > 0;
}

}  // namespace strata::codec
