#pragma once
#include <strata/codec/serializer.hpp>

namespace strata::codec {

/// Default codec of every registered class without a codec of its own.
///
/// Fields are written in declaration order as `alias (u16 BE) | value`,
/// values untagged. Decoding reads exactly as many fields as the class
/// declares, so bytes after the object are never consumed.
class object_serializer final : public serializer {
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
