#include "summary.h"

#include "error.h"
#include "util.h"

#include <sstream>
#include <stdexcept>

namespace larder {

recipe_summary summary_build(std::string const &name,
                             entry_map_t const &entries,
                             resolution_cache_t &cache,
                             resolver::stats *out_stats) {
  auto const it{ entries.find(name) };
  if (it == entries.end()) {
    throw cookbook_error(error_kind::NOT_FOUND, "no entry named '" + name + "'");
  }

  auto const *root{ std::get_if<recipe>(&it->second) };
  if (!root) {
    throw cookbook_error(error_kind::WRONG_TYPE,
                         "'" + name + "' is an ingredient, not a recipe");
  }

  resolver r{ entries, cache };
  auto const frequencies{ r.resolve(*root) };
  if (out_stats) { *out_stats = r.get_stats(); }

  return summary_project(name, frequencies, entries);
}

recipe_summary summary_project(std::string name,
                               frequency_map_t const &frequencies,
                               entry_map_t const &entries) {
  recipe_summary result{ .name = std::move(name), .cook_time = 0, .ingredients = {} };
  result.ingredients.reserve(frequencies.size());

  for (auto const &[ingredient_name, quantity] : frequencies) {
    auto const it{ entries.find(ingredient_name) };
    auto const *ing{ it == entries.end() ? nullptr : std::get_if<ingredient>(&it->second) };
    if (!ing) {
      throw std::runtime_error("summary: '" + ingredient_name +
                               "' is not a registered ingredient");
    }

    auto const time{ util_checked_mul(quantity, ing->cook_time) };
    auto const total{ time ? util_checked_add(result.cook_time, *time) : std::nullopt };
    if (!total) {
      throw cookbook_error(error_kind::QUANTITY_OVERFLOW,
                           "cook time of recipe '" + result.name + "' overflows");
    }
    result.cook_time = *total;
    result.ingredients.push_back({ .name = ingredient_name, .quantity = quantity });
  }

  return result;
}

std::string summary_to_json(recipe_summary const &summary) {
  std::string out{ "{\"name\":" };
  out.append(util_json_quote(summary.name));
  out.append(",\"cookTime\":");
  out.append(std::to_string(summary.cook_time));
  out.append(",\"ingredients\":[");

  bool first{ true };
  for (auto const &item : summary.ingredients) {
    if (!first) { out.push_back(','); }
    first = false;
    out.append("{\"name\":");
    out.append(util_json_quote(item.name));
    out.append(",\"quantity\":");
    out.append(std::to_string(item.quantity));
    out.push_back('}');
  }

  out.append("]}");
  return out;
}

std::string summary_to_text(recipe_summary const &summary) {
  std::ostringstream oss;
  oss << summary.name << " (cook time " << summary.cook_time << ")\n";
  if (summary.ingredients.empty()) {
    oss << "  (no ingredients)\n";
    return oss.str();
  }
  for (auto const &item : summary.ingredients) {
    oss << "  " << item.quantity << " x " << item.name << "\n";
  }
  return oss.str();
}

}  // namespace larder
