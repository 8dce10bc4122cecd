#pragma once

#include "entry.h"
#include "resolver.h"

#include <cstdint>
#include <string>
#include <vector>

namespace larder {

struct ingredient_quantity {
  std::string name;
  std::int64_t quantity{ 0 };

  bool operator==(ingredient_quantity const &) const = default;
};

struct recipe_summary {
  std::string name;
  std::int64_t cook_time{ 0 };
  std::vector<ingredient_quantity> ingredients;  // ordered by ingredient name
};

// Resolve `name` against entries and project the result. Caller holds the registry
// lock (shared is sufficient).
// Throws cookbook_error: NOT_FOUND, WRONG_TYPE, or the resolver's failure unchanged.
recipe_summary summary_build(std::string const &name,
                             entry_map_t const &entries,
                             resolution_cache_t &cache,
                             resolver::stats *out_stats = nullptr);

// Total cook time is sum(quantity * cook_time) with cook times read from entries.
recipe_summary summary_project(std::string name,
                               frequency_map_t const &frequencies,
                               entry_map_t const &entries);

// {"name":..,"cookTime":..,"ingredients":[{"name":..,"quantity":..},..]}
std::string summary_to_json(recipe_summary const &summary);

std::string summary_to_text(recipe_summary const &summary);

}  // namespace larder
