#pragma once
#include <strata/codec/serializer.hpp>

namespace strata::codec {

/// Default codec of registered `std::vector<E>` types: uint32 count, then
/// the untagged elements.
class sequence_serializer final : public serializer {
 public:
  void encode(strata::engine::loader& loader,
              const std::any& value,
              writer& out,
              const options& options) const override;

  std::any decode(strata::engine::loader& loader,
                  const strata::schema::type_id_t& type,
                  reader& in,
                  const options& options) const override;
};

}  // namespace strata::codec
