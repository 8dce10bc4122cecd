#include "cookbook.h"

#include "error.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace larder {

namespace {

ingredient make_ingredient(entry_request const &request) {
  if (!request.cook_time || *request.cook_time < 0) {
    throw cookbook_error(error_kind::INVALID_FIELD,
                         "invalid cook time for '" + request.name + "'");
  }
  return ingredient{ .name = request.name, .cook_time = *request.cook_time };
}

recipe make_recipe(entry_request const &request) {
  if (!request.required_items) {
    throw cookbook_error(error_kind::INVALID_FIELD,
                         "recipe '" + request.name +
                             "' needs requiredItems as a list of {name, quantity}");
  }

  recipe result{ .name = request.name, .required_items = {} };
  result.required_items.reserve(request.required_items->size());

  // Per item: duplicate name, then negative quantity. A quantity that is not an
  // integer at all is reported only once every name has been checked.
  std::unordered_set<std::string> seen;
  item_request const *untyped{ nullptr };
  for (auto const &item : *request.required_items) {
    if (!seen.insert(item.name).second) {
      throw cookbook_error(error_kind::DUPLICATE_ITEM,
                           "can only have one element per name: '" + item.name + "'");
    }
    if (!item.quantity) {
      if (!untyped) { untyped = &item; }
      continue;
    }
    if (*item.quantity < 0) {
      throw cookbook_error(error_kind::INVALID_FIELD,
                           "invalid quantity for item '" + item.name + "'");
    }
    result.required_items.push_back({ .name = item.name, .quantity = *item.quantity });
  }

  if (untyped) {
    throw cookbook_error(error_kind::INVALID_FIELD,
                         "invalid quantity for item '" + untyped->name + "'");
  }

  return result;
}

entry_t make_entry(entry_request const &request) {
  bool const is_ingredient{ request.type == "ingredient" };
  bool const is_recipe{ request.type == "recipe" };
  if (!is_ingredient && !is_recipe) {
    throw cookbook_error(error_kind::INVALID_TYPE, "invalid type: '" + request.type + "'");
  }

  if (request.name.empty()) {
    throw cookbook_error(error_kind::INVALID_FIELD, "entry name cannot be empty");
  }

  if (is_ingredient) { return make_ingredient(request); }
  return make_recipe(request);
}

}  // namespace

std::string cookbook::create_entry(entry_request const &request) {
  std::unique_lock lock{ mutex_ };

  if (entries_.contains(request.name)) {
    throw cookbook_error(error_kind::DUPLICATE_NAME,
                         "name of the entry must be unique: '" + request.name + "'");
  }

  auto entry{ make_entry(request) };
  std::string const type{ entry_type_name(entry) };

  entries_.emplace(request.name, std::move(entry));
  cache_.clear();

  LARDER_TRACE_ENTRY_CREATED(request.name, type);
  tui::debug("cookbook: added %s '%s'", type.c_str(), request.name.c_str());
  return type + " added";
}

std::string cookbook::add_ingredient(std::string name, std::int64_t cook_time) {
  return create_entry(entry_request{ .type = "ingredient",
                                     .name = std::move(name),
                                     .cook_time = cook_time,
                                     .required_items = std::nullopt });
}

std::string cookbook::add_recipe(std::string name, std::vector<required_item> items) {
  std::vector<item_request> requested;
  requested.reserve(items.size());
  for (auto &item : items) {
    requested.push_back({ .name = std::move(item.name), .quantity = item.quantity });
  }

  return create_entry(entry_request{ .type = "recipe",
                                     .name = std::move(name),
                                     .cook_time = std::nullopt,
                                     .required_items = std::move(requested) });
}

std::optional<entry_t> cookbook::lookup(std::string const &name) const {
  std::shared_lock lock{ mutex_ };
  auto const it{ entries_.find(name) };
  if (it == entries_.end()) { return std::nullopt; }
  return it->second;
}

recipe_summary cookbook::summarize(std::string const &name,
                                   resolver::stats *out_stats) const {
  std::shared_lock lock{ mutex_ };
  return summary_build(name, entries_, cache_, out_stats);
}

std::string cookbook::clear() {
  std::unique_lock lock{ mutex_ };

  auto const entries_removed{ static_cast<std::int64_t>(entries_.size()) };
  auto const cache_entries_removed{ static_cast<std::int64_t>(cache_.size()) };
  entries_.clear();
  cache_.clear();

  LARDER_TRACE_REGISTRY_CLEARED(entries_removed, cache_entries_removed);
  tui::debug("cookbook: cleared %lld entries", static_cast<long long>(entries_removed));
  return "cookbook cleared";
}

std::size_t cookbook::size() const {
  std::shared_lock lock{ mutex_ };
  return entries_.size();
}

std::size_t cookbook::ingredient_count() const {
  std::shared_lock lock{ mutex_ };
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(), [](auto const &kv) {
        return std::holds_alternative<ingredient>(kv.second);
      }));
}

std::vector<std::string> cookbook::recipe_names() const {
  std::vector<std::string> names;
  {
    std::shared_lock lock{ mutex_ };
    for (auto const &[name, entry] : entries_) {
      if (std::holds_alternative<recipe>(entry)) { names.push_back(name); }
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

bool cookbook::is_cached(std::string const &recipe_name) const {
  std::shared_lock lock{ mutex_ };
  return cache_.count(recipe_name) > 0;
}

std::size_t cookbook::cached_count() const {
  std::shared_lock lock{ mutex_ };
  return cache_.size();
}

}  // namespace larder
