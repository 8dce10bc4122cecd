#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace larder {

struct ingredient {
  std::string name;
  std::int64_t cook_time{ 0 };
};

// One unit of the owning recipe requires `quantity` units of the entry `name`.
struct required_item {
  std::string name;
  std::int64_t quantity{ 0 };
};

struct recipe {
  std::string name;
  std::vector<required_item> required_items;  // Declared order, unique names
};

using entry_t = std::variant<ingredient, recipe>;
using entry_map_t = std::unordered_map<std::string, entry_t>;

// Ingredient name -> total quantity per one unit of a recipe. Ordered so summaries
// list ingredients deterministically.
using frequency_map_t = std::map<std::string, std::int64_t>;

std::string const &entry_name(entry_t const &entry);
std::string_view entry_type_name(entry_t const &entry);  // "ingredient" / "recipe"

// Untyped creation requests, as they arrive from a cookbook file, a script or the wire.
// Readers record what they found and leave every check to the registry, so failures
// are reported in the same order whatever the source. A field that is absent or has
// the wrong Lua type is carried as "" / nullopt.
struct item_request {
  std::string name;
  std::optional<std::int64_t> quantity;
};

struct entry_request {
  std::string type;
  std::string name;
  std::optional<std::int64_t> cook_time;
  std::optional<std::vector<item_request>> required_items;
};

}  // namespace larder
