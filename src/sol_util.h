#pragma once

#include "sol/sol.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace larder {

using sol_state_ptr = std::unique_ptr<sol::state>;
sol_state_ptr sol_util_make_lua_state();  // with std libs

// Integer field that must be present, numeric and integral. Absent, non-numeric or
// fractional values yield nullopt so callers can map them onto their own error.
std::optional<std::int64_t> sol_util_get_integer(sol::object const &obj);

}  // namespace larder
