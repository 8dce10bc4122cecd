#pragma once

#include "entry.h"
#include "resolver.h"
#include "summary.h"
#include "util.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace larder {

// In-memory registry of ingredients and recipes sharing one namespace, plus the
// resolution cache derived from it. One shared_mutex guards both: creation and clear
// are exclusive, lookups and summaries run concurrently.
class cookbook : unmovable {
 public:
  cookbook() = default;

  // Validates and inserts an entry; returns "ingredient added" / "recipe added".
  // Throws cookbook_error: DUPLICATE_NAME, INVALID_TYPE, INVALID_FIELD, DUPLICATE_ITEM.
  // Required-item names are not checked here; see summarize().
  std::string create_entry(entry_request const &request);
  std::string add_ingredient(std::string name, std::int64_t cook_time);
  std::string add_recipe(std::string name, std::vector<required_item> items);

  std::optional<entry_t> lookup(std::string const &name) const;

  // Throws cookbook_error: NOT_FOUND, WRONG_TYPE, UNKNOWN_ITEM, CIRCULAR_DEPENDENCY,
  // QUANTITY_OVERFLOW.
  recipe_summary summarize(std::string const &name,
                           resolver::stats *out_stats = nullptr) const;

  // Empties the registry and the resolution cache together. Returns "cookbook cleared".
  std::string clear();

  std::size_t size() const;
  std::size_t ingredient_count() const;
  std::vector<std::string> recipe_names() const;  // sorted

  bool is_cached(std::string const &recipe_name) const;
  std::size_t cached_count() const;

 private:
  mutable std::shared_mutex mutex_;
  entry_map_t entries_;
  mutable resolution_cache_t cache_;
};

}  // namespace larder
