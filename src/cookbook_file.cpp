#include "cookbook_file.h"

#include "cookbook.h"
#include "error.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <stdexcept>
#include <string>

namespace larder {

namespace {

std::string string_or_empty(sol::object const &obj) {
  if (!obj.valid() || obj.get_type() != sol::type::string) { return {}; }
  return obj.as<std::string>();
}

// nullopt unless obj is an array of tables with string names; per-item quantities are
// carried unchecked.
std::optional<std::vector<item_request>> parse_required_items(sol::object const &obj) {
  if (!obj.valid() || obj.get_type() != sol::type::table) { return std::nullopt; }

  sol::table const items_table{ obj.as<sol::table>() };
  std::vector<item_request> items;
  for (size_t i{ 1 }, n{ items_table.size() }; i <= n; ++i) {
    sol::object const item_obj{ items_table[i] };
    if (item_obj.get_type() != sol::type::table) { return std::nullopt; }

    sol::table const item{ item_obj.as<sol::table>() };
    sol::object const name_obj{ item["name"] };
    if (name_obj.get_type() != sol::type::string) { return std::nullopt; }

    sol::object const quantity_obj{ item["quantity"] };
    items.push_back(item_request{ .name = name_obj.as<std::string>(),
                                  .quantity = sol_util_get_integer(quantity_obj) });
  }

  return items;
}

}  // namespace

entry_request cookbook_file::parse_entry(sol::object const &obj, std::string_view context) {
  if (obj.get_type() != sol::type::table) {
    throw std::runtime_error(std::string(context) + " must be a table");
  }

  sol::table const table{ obj.as<sol::table>() };
  sol::object const type_obj{ table["type"] };
  sol::object const name_obj{ table["name"] };
  sol::object const cook_time_obj{ table["cookTime"] };
  sol::object const items_obj{ table["requiredItems"] };

  return entry_request{ .type = string_or_empty(type_obj),
                        .name = string_or_empty(name_obj),
                        .cook_time = sol_util_get_integer(cook_time_obj),
                        .required_items = parse_required_items(items_obj) };
}

std::optional<std::filesystem::path> cookbook_file::discover() {
  namespace fs = std::filesystem;

  auto cur{ fs::current_path() };

  for (;;) {
    auto const candidate{ cur / kFileName };
    if (fs::exists(candidate)) { return candidate; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::filesystem::path cookbook_file::find_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("cookbook not found: " + path.string());
    }
    return path;
  }

  if (auto const discovered{ discover() }) { return *discovered; }
  throw std::runtime_error(std::string("cookbook not found (no ") + kFileName +
                           " in current directory or its parents)");
}

void cookbook_file::load(std::filesystem::path const &path, cookbook &book) {
  tui::debug("Loading cookbook from file: %s", path.string().c_str());
  auto const content{ util_load_file(path) };
  std::string const script{ reinterpret_cast<char const *>(content.data()),
                            content.size() };
  load(script, book, path.string());
}

void cookbook_file::load(std::string_view script,
                         cookbook &book,
                         std::string_view chunk_name) {
  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error, std::string{ chunk_name }) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error(std::string("Failed to execute cookbook script: ") +
                             err.what());
  }

  sol::object const entries_obj{ (*state)["ENTRIES"] };
  if (!entries_obj.valid() || entries_obj.get_type() != sol::type::table) {
    throw std::runtime_error("Cookbook must define 'ENTRIES' global as a table");
  }

  sol::table const entries_table{ entries_obj.as<sol::table>() };
  size_t const count{ entries_table.size() };

  for (size_t i{ 1 }; i <= count; ++i) {
    std::string const context{ "ENTRIES[" + std::to_string(i) + "]" };
    try {
      sol::object const entry_obj{ entries_table[i] };
      book.create_entry(parse_entry(entry_obj, context));
    } catch (cookbook_error const &e) {
      throw cookbook_error(e.kind(), context + ": " + e.what());
    }
  }

  tui::debug("Loaded %zu cookbook entries", count);
}

}  // namespace larder
