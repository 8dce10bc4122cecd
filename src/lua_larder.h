#pragma once

#include "sol/sol.hpp"

namespace larder {

class cookbook;

// Install the `larder` global table: logging, parse(), and when book is non-null the
// cookbook operations (add_entry, add_ingredient, add_recipe, lookup, summary, clear).
// book must outlive the Lua state.
void lua_larder_install(sol::state &lua, cookbook *book);

}  // namespace larder
