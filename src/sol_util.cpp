#include "sol_util.h"

namespace larder {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::package,
                      sol::lib::string,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::debug);

  // Cookbook scripts report errors with a stack trace
  lua->script(R"lua(
do
  local orig_error = error
  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end
end
)lua");

  return lua;
}

std::optional<std::int64_t> sol_util_get_integer(sol::object const &obj) {
  if (!obj.valid() || obj.get_type() != sol::type::number) { return std::nullopt; }

  // Integer subtypes come back exactly; floats only when integral and in range.
  lua_State *lua{ obj.lua_state() };
  obj.push();
  int is_integer{ 0 };
  lua_Integer const value{ lua_tointegerx(lua, -1, &is_integer) };
  lua_pop(lua, 1);

  if (!is_integer) { return std::nullopt; }
  return static_cast<std::int64_t>(value);
}

}  // namespace larder
