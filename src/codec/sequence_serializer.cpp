#include <strata/codec/sequence_serializer.hpp>
#include <strata/common/error.hpp>
#include <strata/engine/loader.hpp>

#include <utility>

using namespace strata::schema;

namespace strata::codec {

namespace {

const sequence_definition& get_sequence(const strata::engine::loader& loader,
                                        const type_id_t& type) {
  const auto* sequence = loader.schemas().find_sequence(type);
  if (sequence == nullptr) {
    throw unregistered_type_error{fmt::format(
        "no sequence definition registered for '{}'", type.name())};
  }
  return *sequence;
}

}  // namespace

void sequence_serializer::encode(strata::engine::loader& loader,
                                 const std::any& value,
                                 writer& out,
                                 const options& options) const {
  const auto& sequence = get_sequence(loader, type_of(value));
  const auto size = sequence.size(value);
  out.write_length(size);
  for (size_t i = 0; i < size; ++i) {
    loader.serialize(sequence.element(value, i), out, options);
  }
}

std::any sequence_serializer::decode(strata::engine::loader& loader,
                                     const type_id_t& type,
                                     reader& in,
                                     const options& options) const {
  const auto& sequence = get_sequence(loader, type);
  // Elements of field-less classes encode to nothing, so only the configured
  // limit bounds the count.
  const auto length = in.read_length(loader.config().max_length, 0);
  auto out = sequence.make();
  for (size_t i = 0; i < length; ++i) {
    sequence.append(out, loader.deserialize(in, sequence.element_type, options));
  }
  return out;
}

}  // namespace strata::codec
