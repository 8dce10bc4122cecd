#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace larder {

namespace {

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  util_append_json_escaped(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(entry_created),
          TRACE_NAME(registry_cleared),
          TRACE_NAME(resolve_start),
          TRACE_NAME(resolve_cache_hit),
          TRACE_NAME(resolve_complete),
          TRACE_NAME(resolve_failed),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::entry_created const &value) {
            std::ostringstream oss;
            oss << "entry_created name=" << value.name << " type=" << value.type;
            return oss.str();
          },
          [](trace_events::registry_cleared const &value) {
            std::ostringstream oss;
            oss << "registry_cleared entries_removed=" << value.entries_removed
                << " cache_entries_removed=" << value.cache_entries_removed;
            return oss.str();
          },
          [](trace_events::resolve_start const &value) {
            std::ostringstream oss;
            oss << "resolve_start recipe=" << value.recipe << " depth=" << value.depth;
            return oss.str();
          },
          [](trace_events::resolve_cache_hit const &value) {
            std::ostringstream oss;
            oss << "resolve_cache_hit recipe=" << value.recipe << " depth=" << value.depth;
            return oss.str();
          },
          [](trace_events::resolve_complete const &value) {
            std::ostringstream oss;
            oss << "resolve_complete recipe=" << value.recipe
                << " ingredient_count=" << value.ingredient_count
                << " depth=" << value.depth;
            return oss.str();
          },
          [](trace_events::resolve_failed const &value) {
            std::ostringstream oss;
            oss << "resolve_failed recipe=" << value.recipe << " kind=" << value.kind
                << " reason=" << value.reason;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(192);
  output.push_back('{');
  output.append("\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.push_back('"');
  append_kv(output, "event", trace_event_name(event));

  std::visit(
      match{
          [&](trace_events::entry_created const &value) {
            append_kv(output, "name", value.name);
            append_kv(output, "type", value.type);
          },
          [&](trace_events::registry_cleared const &value) {
            append_kv(output, "entries_removed", value.entries_removed);
            append_kv(output, "cache_entries_removed", value.cache_entries_removed);
          },
          [&](trace_events::resolve_start const &value) {
            append_kv(output, "recipe", value.recipe);
            append_kv(output, "depth", value.depth);
          },
          [&](trace_events::resolve_cache_hit const &value) {
            append_kv(output, "recipe", value.recipe);
            append_kv(output, "depth", value.depth);
          },
          [&](trace_events::resolve_complete const &value) {
            append_kv(output, "recipe", value.recipe);
            append_kv(output, "ingredient_count", value.ingredient_count);
            append_kv(output, "depth", value.depth);
          },
          [&](trace_events::resolve_failed const &value) {
            append_kv(output, "recipe", value.recipe);
            append_kv(output, "kind", value.kind);
            append_kv(output, "reason", value.reason);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace larder
