#pragma once
#include <strata/schema/registry.hpp>
#include <any>
#include <string>

namespace strata::format {

/// Human readable rendering of a decoded value, e.g.
/// `point{x=1, y=-2}`, `[1, "a", true]`, `{"k": 2.5}`.
///
/// Values without a built-in rendering or class definition print as
/// `<type name>`.
std::string render(const strata::schema::registry& schemas,
                   const std::any& value);

}  // namespace strata::format
