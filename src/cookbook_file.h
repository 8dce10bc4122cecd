#pragma once

#include "entry.h"

#include "sol/sol.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace larder {

class cookbook;

// A cookbook file is a Lua script defining a global ENTRIES array:
//
//   ENTRIES = {
//     { type = "ingredient", name = "Egg", cookTime = 5 },
//     { type = "recipe", name = "Batter",
//       requiredItems = { { name = "Egg", quantity = 2 } } },
//   }
struct cookbook_file {
  static constexpr char const *kFileName{ "cookbook.lua" };

  // Use explicit path if given, otherwise discover from current directory.
  // Returns absolute path or throws if not found.
  static std::filesystem::path find_path(
      std::optional<std::filesystem::path> const &explicit_path);

  // Search upward from the current directory; stops at a .git directory or the root.
  static std::optional<std::filesystem::path> discover();

  // Execute the script and apply ENTRIES to book in order. The first failing entry
  // aborts loading: cookbook_error keeps its kind with an "ENTRIES[i]" prefix.
  static void load(std::filesystem::path const &path, cookbook &book);
  static void load(std::string_view script, cookbook &book, std::string_view chunk_name);

  // Parse a single ENTRIES element into a creation request. Throws only when obj is not
  // a table; bad field values are left for cookbook::create_entry to report.
  static entry_request parse_entry(sol::object const &obj, std::string_view context);
};

}  // namespace larder
