#include "tui.h"

#include "util.h"

#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace larder::tui {

bool g_trace_enabled{ false };

namespace {

struct log_line {
  std::chrono::system_clock::time_point when;
  level severity;
  std::string text;
};

using queued_t = std::variant<log_line, trace_event_t>;
using batch_t = std::vector<queued_t>;

struct log_state {
  batch_t queue;
  std::function<void(std::string_view)> sink;  // empty: stderr
  std::thread worker;
  std::mutex mutex;  // queue, stopping; sink and trace outputs while idle
  std::mutex stdout_mutex;
  std::condition_variable cv;
  bool stopping{ false };
  std::optional<level> threshold;
  bool decorated{ false };
  bool initialized{ false };
  bool trace_stderr{ false };
  file_ptr_t trace_file;
};

log_state s_log;

char const *severity_label(level value) {
  switch (value) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[YYYY-MM-DD HH:MM:SS.mmm] [LVL] " when decorated, else empty.
std::string line_prefix(level severity, std::chrono::system_clock::time_point when) {
  if (!s_log.decorated) { return {}; }

  std::time_t const seconds{ std::chrono::system_clock::to_time_t(when) };
  auto const millis{ std::chrono::duration_cast<std::chrono::milliseconds>(
                         when.time_since_epoch())
                         .count() %
                     1000 };

  std::tm local{};
  localtime_r(&seconds, &local);

  char stamp[32]{};
  if (std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local) == 0) { return {}; }

  char prefix[64]{};
  std::snprintf(prefix,
                sizeof prefix,
                "[%s.%03lld] [%s] ",
                stamp,
                static_cast<long long>(millis),
                severity_label(severity));
  return prefix;
}

std::string vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const needed{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (needed <= 0) { return {}; }

  std::string out(static_cast<std::size_t>(needed), '\0');
  std::vsnprintf(out.data(), out.size() + 1, fmt, args);
  return out;
}

void write_line(level severity,
                std::chrono::system_clock::time_point when,
                std::string_view text) {
  auto line{ line_prefix(severity, when) };
  line.append(text);
  line.push_back('\n');

  if (s_log.sink) {
    s_log.sink(line);
  } else {
    std::fwrite(line.data(), 1, line.size(), stderr);
  }
}

// A trace file that stops accepting writes is closed; stderr tracing carries on.
void write_trace_file(trace_event_t const &event) {
  auto const json{ trace_event_to_json(event) + "\n" };
  std::FILE *file{ s_log.trace_file.get() };
  if (std::fwrite(json.data(), 1, json.size(), file) == json.size() &&
      std::fflush(file) == 0) {
    return;
  }

  s_log.trace_file.reset();
  write_line(level::TUI_ERROR,
             std::chrono::system_clock::now(),
             "trace file write failed, file tracing disabled");
}

// Only one thread flushes at a time: the worker while running, else the caller under
// s_log.mutex.
void flush(batch_t &batch) {
  for (auto const &item : batch) {
    std::visit(match{ [](log_line const &line) {
                       write_line(line.severity, line.when, line.text);
                     },
                      [](trace_event_t const &event) {
                        if (s_log.trace_stderr) {
                          write_line(level::TUI_TRACE,
                                     std::chrono::system_clock::now(),
                                     trace_event_to_string(event));
                        }
                        if (s_log.trace_file) { write_trace_file(event); }
                      } },
               item);
  }
  batch.clear();

  if (!s_log.sink) { std::fflush(stderr); }
}

void worker_main() {
  batch_t batch;
  std::unique_lock lock{ s_log.mutex };

  for (;;) {
    s_log.cv.wait(lock, [] { return s_log.stopping || !s_log.queue.empty(); });
    batch.swap(s_log.queue);
    bool const last{ s_log.stopping };
    lock.unlock();

    try {
      flush(batch);
    } catch (std::exception const &e) {
      batch.clear();
      std::fprintf(stderr, "[tui worker: %s]\n", e.what());
      std::fflush(stderr);
    }

    if (last) { return; }
    lock.lock();
  }
}

void submit(queued_t item) {
  std::unique_lock lock{ s_log.mutex };

  if (!s_log.worker.joinable()) {
    batch_t batch;
    batch.push_back(std::move(item));
    flush(batch);
    return;
  }

  s_log.queue.push_back(std::move(item));
  lock.unlock();
  s_log.cv.notify_one();
}

void log_printf(level severity, char const *fmt, va_list args) {
  if (!s_log.initialized || fmt == nullptr) { return; }
  if (s_log.threshold && severity < *s_log.threshold) { return; }

  auto text{ vformat(fmt, args) };
  if (text.empty()) { return; }

  submit(log_line{ .when = std::chrono::system_clock::now(),
                   .severity = severity,
                   .text = std::move(text) });
}

}  // namespace

void init() {
  if (s_log.initialized) { throw std::logic_error{ "larder::tui::init called twice" }; }

  s_log.threshold.reset();
  s_log.decorated = false;
  s_log.initialized = true;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  if (!s_log.initialized) {
    throw std::logic_error{ "larder::tui::configure_trace_outputs called before init" };
  }
  if (s_log.worker.joinable()) {
    throw std::logic_error{ "larder::tui::configure_trace_outputs called while running" };
  }

  s_log.trace_file.reset();
  s_log.trace_stderr = false;

  for (auto const &spec : outputs) {
    if (spec.type == trace_output_type::std_err) {
      s_log.trace_stderr = true;
      continue;
    }
    if (!spec.file_path) { continue; }

    if (s_log.trace_file) { throw std::logic_error{ "Only one trace file output supported" }; }
    s_log.trace_file = util_open_file(*spec.file_path, "w");
    if (!s_log.trace_file) {
      throw std::runtime_error("Failed to open trace file: " + spec.file_path->string());
    }
  }

  g_trace_enabled = s_log.trace_stderr || s_log.trace_file;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  if (!s_log.initialized) {
    throw std::logic_error{ "larder::tui::set_output_handler called before init" };
  }
  if (s_log.worker.joinable()) {
    throw std::logic_error{ "larder::tui::set_output_handler called while running" };
  }

  std::lock_guard lock{ s_log.mutex };
  s_log.sink = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_log.initialized) { throw std::logic_error{ "larder::tui::run called before init" }; }
  if (s_log.worker.joinable()) {
    throw std::logic_error{ "larder::tui::run called while already running" };
  }

  s_log.threshold = threshold;
  s_log.decorated = decorated_logging;
  s_log.stopping = false;
  s_log.worker = std::thread{ worker_main };
}

void shutdown() {
  if (!s_log.worker.joinable()) {
    throw std::logic_error{ "larder::tui::shutdown called while not running" };
  }

  {
    std::lock_guard lock{ s_log.mutex };
    s_log.stopping = true;
  }
  s_log.cv.notify_all();
  s_log.worker.join();
  s_log.worker = std::thread{};
  s_log.stopping = false;

  g_trace_enabled = false;
  s_log.trace_file.reset();
}

void trace(trace_event_t event) {
  if (!g_trace_enabled) { return; }
  submit(std::move(event));
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_printf(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_printf(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_printf(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_printf(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  va_list args;
  va_start(args, fmt);
  auto const text{ vformat(fmt, args) };
  va_end(args);
  if (text.empty()) { return; }

  std::lock_guard lock{ s_log.stdout_mutex };
  std::fwrite(text.data(), 1, text.size(), stdout);
  std::fflush(stdout);
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_log.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace larder::tui
