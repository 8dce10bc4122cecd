#include "resolver.h"

#include "error.h"
#include "trace.h"
#include "util.h"

#include <algorithm>

namespace larder {

namespace {

[[noreturn]] void throw_overflow(std::string const &recipe_name,
                                 std::string const &ingredient_name) {
  throw cookbook_error(error_kind::QUANTITY_OVERFLOW,
                       "quantity of '" + ingredient_name + "' in recipe '" + recipe_name +
                           "' overflows");
}

struct in_progress_guard {
  std::vector<std::string> &path;

  in_progress_guard(std::vector<std::string> &p, std::string const &name) : path{ p } {
    path.push_back(name);
  }
  ~in_progress_guard() { path.pop_back(); }

  in_progress_guard(in_progress_guard const &) = delete;
  in_progress_guard &operator=(in_progress_guard const &) = delete;
};

}  // namespace

void resolver_validate_cycle(std::string const &candidate,
                             std::vector<std::string> const &in_progress) {
  auto const it{ std::find(in_progress.begin(), in_progress.end(), candidate) };
  if (it == in_progress.end()) { return; }

  std::string chain;
  for (auto cur{ it }; cur != in_progress.end(); ++cur) {
    chain += *cur;
    chain += " -> ";
  }
  chain += candidate;

  throw cookbook_error(error_kind::CIRCULAR_DEPENDENCY,
                       "circular dependency detected: " + chain);
}

resolver::resolver(entry_map_t const &entries, resolution_cache_t &cache)
    : entries_{ entries }, cache_{ cache } {}

frequency_map_t resolver::resolve(recipe const &root) {
  in_progress_.clear();

  try {
    return resolve_recipe(root);
  } catch (cookbook_error const &e) {
    LARDER_TRACE_RESOLVE_FAILED(root.name, std::string{ error_kind_name(e.kind()) }, e.what());
    throw;
  }
}

frequency_map_t resolver::resolve_recipe(recipe const &r) {
  auto const depth{ static_cast<std::int64_t>(in_progress_.size()) };

  {
    resolution_cache_t::const_accessor hit;
    if (cache_.find(hit, r.name)) {
      ++stats_.cache_hits;
      LARDER_TRACE_RESOLVE_CACHE_HIT(r.name, depth);
      return hit->second;
    }
  }

  resolver_validate_cycle(r.name, in_progress_);

  LARDER_TRACE_RESOLVE_START(r.name, depth);
  in_progress_guard const guard{ in_progress_, r.name };

  frequency_map_t frequencies;
  for (auto const &item : r.required_items) {
    auto const it{ entries_.find(item.name) };
    if (it == entries_.end()) {
      throw cookbook_error(error_kind::UNKNOWN_ITEM,
                           "recipe '" + r.name + "' requires unknown item '" + item.name +
                               "'");
    }

    if (auto const *ing{ std::get_if<ingredient>(&it->second) }) {
      auto &total{ frequencies[ing->name] };
      auto const sum{ util_checked_add(total, item.quantity) };
      if (!sum) { throw_overflow(r.name, ing->name); }
      total = *sum;
      continue;
    }

    auto const child{ resolve_recipe(std::get<recipe>(it->second)) };
    for (auto const &[ingredient_name, sub_quantity] : child) {
      auto &total{ frequencies[ingredient_name] };
      auto const scaled{ util_checked_mul(item.quantity, sub_quantity) };
      auto const sum{ scaled ? util_checked_add(total, *scaled) : std::nullopt };
      if (!sum) { throw_overflow(r.name, ingredient_name); }
      total = *sum;
    }
  }

  ++stats_.computed;
  // no-op if a concurrent resolution of the same recipe won
  cache_.insert(resolution_cache_t::value_type{ r.name, frequencies });
  LARDER_TRACE_RESOLVE_COMPLETE(r.name,
                                static_cast<std::int64_t>(frequencies.size()),
                                depth);
  return frequencies;
}

}  // namespace larder
