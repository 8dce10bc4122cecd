#pragma once

#include "entry.h"
#include "util.h"

#include <tbb/concurrent_hash_map.h>

#include <cstddef>
#include <string>
#include <vector>

namespace larder {

// Recipe name -> fully resolved ingredient frequencies. Safe for concurrent readers
// and writers; callers hold the registry's shared lock while using it, so it is never
// cleared underneath a resolution.
using resolution_cache_t = tbb::concurrent_hash_map<std::string, frequency_map_t>;

// Depth-first, memoized expansion of a recipe into base-ingredient quantities.
// One resolver per top-level request: it owns the in-progress path used for cycle
// detection, so it must not be shared between threads.
class resolver : unmovable {
 public:
  struct stats {
    std::size_t computed{ 0 };    // recipes expanded by traversing their items
    std::size_t cache_hits{ 0 };  // recipes served from the resolution cache
  };

  resolver(entry_map_t const &entries, resolution_cache_t &cache);

  // Throws cookbook_error(UNKNOWN_ITEM | CIRCULAR_DEPENDENCY | QUANTITY_OVERFLOW).
  // Nothing is cached for a recipe whose resolution fails.
  frequency_map_t resolve(recipe const &root);

  stats const &get_stats() const { return stats_; }

 private:
  frequency_map_t resolve_recipe(recipe const &r);

  entry_map_t const &entries_;
  resolution_cache_t &cache_;
  std::vector<std::string> in_progress_;  // recipes on the current call stack, in order
  stats stats_;
};

// Throws cookbook_error(CIRCULAR_DEPENDENCY) if candidate is already on the in-progress
// path. The message names the cycle, e.g. "circular dependency detected: A -> B -> A".
void resolver_validate_cycle(std::string const &candidate,
                             std::vector<std::string> const &in_progress);

}  // namespace larder
