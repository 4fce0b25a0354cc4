#pragma once

#include <cstdint>

namespace strata {

/// Engine wide knobs. Registries and the loader copy it at construction.
struct config final {
  /// First auto-generated field alias of every class definition.
  uint16_t alias_base{0};
  /// First auto-generated type tag. Tags below it are left to the built-ins
  /// and to explicit bindings.
  uint16_t tag_base{16};
  /// Deepest value nesting accepted while decoding.
  uint32_t max_depth{256};
  /// Largest string byte length or container element count accepted while
  /// decoding.
  uint32_t max_length{16u * 1024u * 1024u};
  bool validate_utf8{true};
};

}  // namespace strata
