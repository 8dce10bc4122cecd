#include "tui.h"

#include "cookbook.h"
#include "error.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(larder::tui::init(), std::logic_error);
}

TEST_CASE("tui allows handler changes while idle") {
  CHECK_NOTHROW(larder::tui::set_output_handler([](std::string_view) {}));
  CHECK_NOTHROW(larder::tui::set_output_handler([](std::string_view) {}));
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(larder::tui::set_output_handler(handler));
  CHECK_NOTHROW(larder::tui::run(larder::tui::level::TUI_INFO));
  CHECK_NOTHROW(larder::tui::shutdown());

  CHECK_NOTHROW(larder::tui::run(std::nullopt));
  CHECK_THROWS_AS(larder::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(larder::tui::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(larder::tui::shutdown());
  CHECK_THROWS_AS(larder::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(larder::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    larder::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      larder::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

void expect_json_tokens(larder::trace_event_t const &event,
                        std::vector<std::string> tokens) {
  auto const json{ larder::trace_event_to_json(event) };
  CHECK_MESSAGE(json.find("\"ts\"") != std::string::npos, "missing timestamp in json");
  tokens.emplace_back(std::string{ "\"event\":\"" } +
                      std::string(larder::trace_event_name(event)) + "\"");
  for (auto const &token : tokens) {
    CHECK_MESSAGE(json.find(token) != std::string::npos,
                  "missing token: " << token << " in json: " << json);
  }
}

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  REQUIRE(messages.empty());

  CHECK_NOTHROW(larder::tui::run(std::nullopt));

  larder::tui::debug("hello %s", "world");
  larder::tui::info("value %d", 42);
  larder::tui::warn("three %d", 3);
  larder::tui::error("boom");

  CHECK_NOTHROW(larder::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(larder::tui::run(larder::tui::level::TUI_DEBUG, true));
  larder::tui::info("structured %d", 7);
  CHECK_NOTHROW(larder::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.starts_with("["));
  CHECK(line.find("] [INF] ") != std::string::npos);
  CHECK(line.ends_with("structured 7\n"));
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(larder::tui::run(larder::tui::level::TUI_WARN, true));
  larder::tui::debug("debug");
  larder::tui::info("info");
  larder::tui::warn("warn");
  larder::tui::error("error");
  CHECK_NOTHROW(larder::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui delivers synchronously while not running") {
  CHECK_NOTHROW(larder::tui::run(std::nullopt));
  CHECK_NOTHROW(larder::tui::shutdown());
  REQUIRE(messages.empty());

  larder::tui::info("early %s", "bird");
  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "early bird\n");
}

TEST_CASE_FIXTURE(captured_output, "tui trace events reach handler") {
  larder::tui::configure_trace_outputs(
      { { larder::tui::trace_output_type::std_err, std::nullopt } });
  CHECK(larder::tui::trace_enabled());
  CHECK_NOTHROW(larder::tui::run(larder::tui::level::TUI_TRACE, false));

  LARDER_TRACE_RESOLVE_START("pancake", 0);

  CHECK_NOTHROW(larder::tui::shutdown());
  CHECK_FALSE(larder::tui::trace_enabled());
  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "resolve_start recipe=pancake depth=0\n");

  larder::tui::configure_trace_outputs({});
}

TEST_CASE_FIXTURE(captured_output, "tui trace macros are silent when disabled") {
  larder::tui::configure_trace_outputs({});
  LARDER_TRACE_ENTRY_CREATED("egg", "ingredient");
  CHECK(messages.empty());
}

TEST_CASE_FIXTURE(captured_output, "cookbook operations emit trace events") {
  larder::tui::configure_trace_outputs(
      { { larder::tui::trace_output_type::std_err, std::nullopt } });
  CHECK_NOTHROW(larder::tui::run(larder::tui::level::TUI_TRACE, false));

  larder::cookbook book;
  book.add_ingredient("egg", 5);
  book.add_recipe("loop", { { "loop", 1 } });
  CHECK_THROWS_AS(book.summarize("loop"), larder::cookbook_error);
  book.clear();

  CHECK_NOTHROW(larder::tui::shutdown());
  larder::tui::configure_trace_outputs({});

  auto const contains{ [&](std::string_view needle) {
    for (auto const &m : messages) {
      if (m.find(needle) != std::string::npos) { return true; }
    }
    return false;
  } };

  CHECK(contains("entry_created name=egg type=ingredient"));
  CHECK(contains("resolve_start recipe=loop depth=0"));
  CHECK(contains("resolve_failed recipe=loop kind=CircularDependency"));
  CHECK(contains("registry_cleared entries_removed=2 cache_entries_removed=0"));
}

TEST_CASE("tui trace file output writes JSON lines") {
  auto const path{ std::filesystem::temp_directory_path() / "larder-trace-test.jsonl" };
  larder::tui::configure_trace_outputs({ { larder::tui::trace_output_type::file, path } });
  CHECK_NOTHROW(larder::tui::run(larder::tui::level::TUI_TRACE, false));
  LARDER_TRACE_RESOLVE_CACHE_HIT("batter", 1);
  CHECK_NOTHROW(larder::tui::shutdown());
  larder::tui::configure_trace_outputs({});

  std::ifstream in{ path };
  std::string line;
  REQUIRE(static_cast<bool>(std::getline(in, line)));
  CHECK(line.find("\"event\":\"resolve_cache_hit\"") != std::string::npos);
  CHECK(line.find("\"recipe\":\"batter\"") != std::string::npos);
  CHECK(line.find("\"depth\":1") != std::string::npos);
  in.close();
  std::filesystem::remove(path);
}

TEST_CASE_FIXTURE(captured_output, "tui closes a trace file that rejects writes") {
  std::filesystem::path const full{ "/dev/full" };  // every write fails with ENOSPC
  if (!std::filesystem::exists(full)) { return; }

  larder::tui::configure_trace_outputs({ { larder::tui::trace_output_type::file, full } });
  CHECK(larder::tui::trace_enabled());

  LARDER_TRACE_RESOLVE_START("pancake", 0);
  LARDER_TRACE_RESOLVE_START("waffle", 0);
  larder::tui::configure_trace_outputs({});

  REQUIRE(messages.size() == 1);
  CHECK(messages[0].ends_with("trace file write failed, file tracing disabled\n"));
}

TEST_CASE("trace_event_to_json serializes all event types") {
  expect_json_tokens(larder::trace_events::entry_created{ .name = "egg",
                                                          .type = "ingredient" },
                     { "\"name\":\"egg\"", "\"type\":\"ingredient\"" });

  expect_json_tokens(
      larder::trace_events::registry_cleared{ .entries_removed = 4,
                                              .cache_entries_removed = 2 },
      { "\"entries_removed\":4", "\"cache_entries_removed\":2" });

  expect_json_tokens(larder::trace_events::resolve_start{ .recipe = "r", .depth = 3 },
                     { "\"recipe\":\"r\"", "\"depth\":3" });

  expect_json_tokens(larder::trace_events::resolve_cache_hit{ .recipe = "r", .depth = 1 },
                     { "\"recipe\":\"r\"", "\"depth\":1" });

  expect_json_tokens(
      larder::trace_events::resolve_complete{ .recipe = "r",
                                              .ingredient_count = 7,
                                              .depth = 0 },
      { "\"recipe\":\"r\"", "\"ingredient_count\":7", "\"depth\":0" });

  expect_json_tokens(
      larder::trace_events::resolve_failed{ .recipe = "r",
                                            .kind = "UnknownItem",
                                            .reason = "missing" },
      { "\"recipe\":\"r\"", "\"kind\":\"UnknownItem\"", "\"reason\":\"missing\"" });
}

TEST_CASE("trace_event_to_json escapes special characters") {
  auto json{ larder::trace_event_to_json(
      larder::trace_events::entry_created{ .name = "r\\back", .type = "recipe" }) };
  CHECK(json.find("r\\\\back") != std::string::npos);

  json = larder::trace_event_to_json(
      larder::trace_events::entry_created{ .name = "r\"quote", .type = "recipe" });
  CHECK(json.find("r\\\"quote") != std::string::npos);

  json = larder::trace_event_to_json(
      larder::trace_events::entry_created{ .name = "r\nline", .type = "recipe" });
  CHECK(json.find("r\\nline") != std::string::npos);
}

TEST_CASE("trace_event_to_string renders key=value pairs") {
  CHECK(larder::trace_event_to_string(larder::trace_events::resolve_complete{
            .recipe = "pancake",
            .ingredient_count = 2,
            .depth = 0 }) == "resolve_complete recipe=pancake ingredient_count=2 depth=0");
  CHECK(larder::trace_event_name(larder::trace_events::registry_cleared{
            .entries_removed = 0,
            .cache_entries_removed = 0 }) == "registry_cleared");
}
