#pragma once

#include "trace.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#if defined(__clang__) || defined(__GNUC__)
#define LARDER_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define LARDER_TUI_PRINTF(idx, first)
#endif

// Leveled printf-style logging. While running, a worker thread writes queued lines
// to stderr (or the installed handler); otherwise lines are written on the caller's
// thread. Trace events (trace.h) go to stderr and/or one JSON-lines file.
namespace larder::tui {

enum class level { TUI_TRACE, TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

enum class trace_output_type { std_err, file };

struct trace_output_spec {
  trace_output_type type;
  std::optional<std::filesystem::path> file_path;
};

void init();
void configure_trace_outputs(std::vector<trace_output_spec> outputs);
void set_output_handler(std::function<void(std::string_view)> handler);  // tests
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

void debug(char const *fmt, ...) LARDER_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) LARDER_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) LARDER_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) LARDER_TUI_PRINTF(1, 2);

void print_stdout(char const *fmt, ...) LARDER_TUI_PRINTF(1, 2);

struct scope {  // run() for the lifetime of main
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace larder::tui

#undef LARDER_TUI_PRINTF
