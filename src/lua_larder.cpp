#include "lua_larder.h"

#include "cookbook.h"
#include "cookbook_file.h"
#include "error.h"
#include "normalize.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace larder {

namespace {

// Surface cookbook_error to Lua as "<Kind>: <message>"; sol2 turns the rethrown
// exception into a Lua error that scripts can pcall().
template <typename Fn>
auto with_lua_errors(Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (cookbook_error const &e) { throw std::runtime_error(cookbook_error_format(e)); }
}

sol::table entry_to_table(sol::state_view lua, entry_t const &entry) {
  return std::visit(
      match{ [&](ingredient const &ing) {
              return lua.create_table_with("type",
                                           "ingredient",
                                           "name",
                                           ing.name,
                                           "cookTime",
                                           ing.cook_time);
            },
             [&](recipe const &r) {
               sol::table items{ lua.create_table() };
               for (size_t i{ 0 }; i < r.required_items.size(); ++i) {
                 auto const &item{ r.required_items[i] };
                 items[i + 1] =
                     lua.create_table_with("name", item.name, "quantity", item.quantity);
               }
               return lua.create_table_with("type",
                                            "recipe",
                                            "name",
                                            r.name,
                                            "requiredItems",
                                            items);
             } },
      entry);
}

sol::table summary_to_table(sol::state_view lua, recipe_summary const &summary) {
  sol::table ingredients{ lua.create_table() };
  for (size_t i{ 0 }; i < summary.ingredients.size(); ++i) {
    auto const &item{ summary.ingredients[i] };
    ingredients[i + 1] = lua.create_table_with("name", item.name, "quantity", item.quantity);
  }
  return lua.create_table_with("name",
                               summary.name,
                               "cookTime",
                               summary.cook_time,
                               "ingredients",
                               ingredients);
}

void install_cookbook_functions(sol::table &larder_table, cookbook *book) {
  larder_table["add_entry"] = [book](sol::object const &tbl) {
    return with_lua_errors(
        [&] { return book->create_entry(cookbook_file::parse_entry(tbl, "add_entry")); });
  };

  larder_table["add_ingredient"] = [book](std::string const &name,
                                          sol::object const &cook_time_obj) {
    return with_lua_errors([&] {
      return book->create_entry(entry_request{ .type = "ingredient",
                                               .name = name,
                                               .cook_time = sol_util_get_integer(cook_time_obj),
                                               .required_items = std::nullopt });
    });
  };

  larder_table["add_recipe"] = [book](std::string const &name,
                                      sol::object const &items,
                                      sol::this_state ts) {
    return with_lua_errors([&] {
      sol::state_view lua{ ts };
      sol::table const tbl{
        lua.create_table_with("type", "recipe", "name", name, "requiredItems", items)
      };
      return book->create_entry(cookbook_file::parse_entry(tbl, "add_recipe"));
    });
  };

  larder_table["lookup"] = [book](std::string const &name,
                                  sol::this_state ts) -> sol::object {
    auto const entry{ book->lookup(name) };
    if (!entry) { return sol::make_object(ts, sol::lua_nil); }
    return entry_to_table(sol::state_view{ ts }, *entry);
  };

  larder_table["summary"] = [book](std::string const &name, sol::this_state ts) {
    return with_lua_errors(
        [&] { return summary_to_table(sol::state_view{ ts }, book->summarize(name)); });
  };

  larder_table["clear"] = [book]() { return book->clear(); };
}

}  // namespace

void lua_larder_install(sol::state &lua, cookbook *book) {
  auto larder_table{ lua.create_table() };
  larder_table["debug"] = [](std::string const &msg) { tui::debug("%s", msg.c_str()); };
  larder_table["info"] = [](std::string const &msg) { tui::info("%s", msg.c_str()); };
  larder_table["warn"] = [](std::string const &msg) { tui::warn("%s", msg.c_str()); };
  larder_table["error"] = [](std::string const &msg) { tui::error("%s", msg.c_str()); };
  larder_table["stdout"] = [](std::string const &msg) {
    tui::print_stdout("%s", msg.c_str());
  };

  larder_table["parse"] = [](std::string const &text) -> std::optional<std::string> {
    return normalize_name(text);
  };

  if (book) { install_cookbook_functions(larder_table, book); }

  lua["larder"] = larder_table;
}

}  // namespace larder
