#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace larder {

namespace trace_events {

struct entry_created {
  std::string name;
  std::string type;
};

struct registry_cleared {
  std::int64_t entries_removed;
  std::int64_t cache_entries_removed;
};

struct resolve_start {
  std::string recipe;
  std::int64_t depth;
};

struct resolve_cache_hit {
  std::string recipe;
  std::int64_t depth;
};

struct resolve_complete {
  std::string recipe;
  std::int64_t ingredient_count;
  std::int64_t depth;
};

struct resolve_failed {
  std::string recipe;
  std::string kind;
  std::string reason;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::entry_created,
                                   trace_events::registry_cleared,
                                   trace_events::resolve_start,
                                   trace_events::resolve_cache_hit,
                                   trace_events::resolve_complete,
                                   trace_events::resolve_failed>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace larder

#define LARDER_TRACE_UNLIKELY [[unlikely]]

#define LARDER_TRACE_EMIT(event_expr) \
  do { \
    if (::larder::tui::g_trace_enabled) LARDER_TRACE_UNLIKELY { \
        ::larder::tui::trace event_expr; \
      } \
  } while (0)

#define LARDER_TRACE_ENTRY_CREATED(name_value, type_value) \
  LARDER_TRACE_EMIT((::larder::trace_events::entry_created{ \
      .name = (name_value), \
      .type = (type_value), \
  }))

#define LARDER_TRACE_REGISTRY_CLEARED(entries_value, cache_entries_value) \
  LARDER_TRACE_EMIT((::larder::trace_events::registry_cleared{ \
      .entries_removed = (entries_value), \
      .cache_entries_removed = (cache_entries_value), \
  }))

#define LARDER_TRACE_RESOLVE_START(recipe_value, depth_value) \
  LARDER_TRACE_EMIT((::larder::trace_events::resolve_start{ \
      .recipe = (recipe_value), \
      .depth = (depth_value), \
  }))

#define LARDER_TRACE_RESOLVE_CACHE_HIT(recipe_value, depth_value) \
  LARDER_TRACE_EMIT((::larder::trace_events::resolve_cache_hit{ \
      .recipe = (recipe_value), \
      .depth = (depth_value), \
  }))

#define LARDER_TRACE_RESOLVE_COMPLETE(recipe_value, ingredient_count_value, depth_value) \
  LARDER_TRACE_EMIT((::larder::trace_events::resolve_complete{ \
      .recipe = (recipe_value), \
      .ingredient_count = (ingredient_count_value), \
      .depth = (depth_value), \
  }))

#define LARDER_TRACE_RESOLVE_FAILED(recipe_value, kind_value, reason_value) \
  LARDER_TRACE_EMIT((::larder::trace_events::resolve_failed{ \
      .recipe = (recipe_value), \
      .kind = (kind_value), \
      .reason = (reason_value), \
  }))
