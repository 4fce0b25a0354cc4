#include <strata/schema/primitives.hpp>

#include <array>

namespace strata::schema {

namespace {

constexpr auto kBuiltinNames = std::array<std::string_view, 8>{
    "bool", "int", "float", "str", "list", "tuple", "set", "map"};

const std::array<type_id_t, 8>& builtin_types() {
  static const auto types = std::array<type_id_t, 8>{
      type_id<boolean_t>(), type_id<integer_t>(), type_id<real_t>(),
      type_id<string_t>(),  type_id<list_t>(),    type_id<tuple_t>(),
      type_id<set_t>(),     type_id<map_t>()};
  return types;
}

// Number of continuation bytes announced by a UTF-8 lead byte, or nullopt.
std::optional<size_t> utf8_continuations(const uint8_t lead) {
  if (lead < 0x80u) {
    return 0;
  }
  if (lead >= 0xC2u && lead <= 0xDFu) {
    return 1;
  }
  if (lead >= 0xE0u && lead <= 0xEFu) {
    return 2;
  }
  if (lead >= 0xF0u && lead <= 0xF4u) {
    return 3;
  }
  return std::nullopt;
}

}  // namespace

type_id_t type_of(const std::any& value) {
  return type_id_t{value.type()};
}

std::optional<std::string_view> builtin_name(const type_id_t& type) {
  const auto& types = builtin_types();
  for (size_t i = 0; i < types.size(); ++i) {
    if (types[i] == type) {
      return kBuiltinNames[i];
    }
  }
  return std::nullopt;
}

std::optional<type_id_t> builtin_type(const std::string_view name) {
  for (size_t i = 0; i < kBuiltinNames.size(); ++i) {
    if (kBuiltinNames[i] == name) {
      return builtin_types()[i];
    }
  }
  return std::nullopt;
}

std::any to_any(const scalar_t& scalar) {
  return std::visit([](const auto& arg) { return std::any{arg}; }, scalar);
}

std::optional<scalar_t> try_make_scalar(const std::any& value) {
  if (const auto* b = std::any_cast<boolean_t>(&value)) {
    return scalar_t{*b};
  }
  if (const auto* i = std::any_cast<integer_t>(&value)) {
    return scalar_t{*i};
  }
  if (const auto* r = std::any_cast<real_t>(&value)) {
    return scalar_t{*r};
  }
  if (const auto* s = std::any_cast<string_t>(&value)) {
    return scalar_t{*s};
  }
  return std::nullopt;
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

bool is_valid_utf8(const bytes_view_t& bytes) {
  auto index = size_t{0};
  while (index < bytes.size()) {
    const auto lead = bytes[index];
    auto continuations = utf8_continuations(lead);
    if (!continuations || *continuations > bytes.size() - index - 1) {
      return false;
    }
    // Reject overlong three/four byte forms, surrogates and code points past
    // U+10FFFF on the first continuation byte.
    if (*continuations > 0) {
      const auto next = bytes[index + 1];
      if ((lead == 0xE0u && next < 0xA0u) || (lead == 0xEDu && next > 0x9Fu) ||
          (lead == 0xF0u && next < 0x90u) || (lead == 0xF4u && next > 0x8Fu)) {
        return false;
      }
    }
    for (size_t i = 1; i <= *continuations; ++i) {
      if ((bytes[index + i] & 0xC0u) != 0x80u) {
        return false;
      }
    }
    index += *continuations + 1;
  }
  return true;
}

}  // namespace strata::schema
