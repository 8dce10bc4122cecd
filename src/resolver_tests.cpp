#include "resolver.h"

#include "error.h"

#include "doctest.h"

#include <string>
#include <vector>

namespace {

struct fixture {
  larder::entry_map_t entries;
  larder::resolution_cache_t cache;

  void ingredient(std::string const &name, std::int64_t cook_time) {
    entries.emplace(name, larder::ingredient{ .name = name, .cook_time = cook_time });
  }

  void recipe(std::string const &name, std::vector<larder::required_item> items) {
    entries.emplace(name,
                    larder::recipe{ .name = name, .required_items = std::move(items) });
  }

  larder::recipe const &get(std::string const &name) const {
    return std::get<larder::recipe>(entries.at(name));
  }

  larder::cookbook_error resolve_error(std::string const &name) {
    larder::resolver r{ entries, cache };
    try {
      r.resolve(get(name));
    } catch (larder::cookbook_error const &e) { return e; }
    FAIL("expected cookbook_error");
    return larder::cookbook_error{ larder::error_kind::INVALID_INPUT, "" };
  }

  void pancakes() {
    ingredient("egg", 5);
    ingredient("flour", 2);
    recipe("batter", { { "egg", 2 }, { "flour", 1 } });
    recipe("pancake", { { "batter", 3 } });
  }
};

}  // namespace

TEST_CASE_FIXTURE(fixture, "resolver multiplies quantities through nested recipes") {
  pancakes();
  larder::resolver r{ entries, cache };
  auto const freq{ r.resolve(get("pancake")) };
  CHECK(freq == larder::frequency_map_t{ { "egg", 6 }, { "flour", 3 } });
}

TEST_CASE_FIXTURE(fixture, "resolver sums an ingredient reached by several paths") {
  ingredient("egg", 5);
  ingredient("milk", 1);
  recipe("custard", { { "egg", 2 }, { "milk", 1 } });
  recipe("tart", { { "custard", 2 }, { "egg", 1 } });

  larder::resolver r{ entries, cache };
  CHECK(r.resolve(get("tart")) == larder::frequency_map_t{ { "egg", 5 }, { "milk", 2 } });
}

TEST_CASE_FIXTURE(fixture, "resolver handles empty recipes and zero quantities") {
  ingredient("egg", 5);
  recipe("nothing", {});
  recipe("ghost", { { "egg", 0 }, { "nothing", 4 } });

  larder::resolver r{ entries, cache };
  CHECK(r.resolve(get("nothing")).empty());
  CHECK(r.resolve(get("ghost")) == larder::frequency_map_t{ { "egg", 0 } });
}

TEST_CASE_FIXTURE(fixture, "resolver memoizes every resolved recipe") {
  pancakes();

  larder::resolver first{ entries, cache };
  first.resolve(get("pancake"));
  CHECK(first.get_stats().computed == 2);
  CHECK(first.get_stats().cache_hits == 0);
  CHECK(cache.count("pancake") == 1);
  CHECK(cache.count("batter") == 1);

  larder::resolver second{ entries, cache };
  CHECK(second.resolve(get("pancake")) ==
        larder::frequency_map_t{ { "egg", 6 }, { "flour", 3 } });
  CHECK(second.get_stats().computed == 0);
  CHECK(second.get_stats().cache_hits == 1);
}

TEST_CASE_FIXTURE(fixture, "resolver reuses shared sub-recipes within one request") {
  ingredient("dough", 1);
  recipe("base", { { "dough", 1 } });
  recipe("left", { { "base", 1 } });
  recipe("right", { { "base", 2 } });
  recipe("top", { { "left", 1 }, { "right", 1 } });

  larder::resolver r{ entries, cache };
  CHECK(r.resolve(get("top")) == larder::frequency_map_t{ { "dough", 3 } });
  CHECK(r.get_stats().computed == 4);
  CHECK(r.get_stats().cache_hits == 1);
}

TEST_CASE_FIXTURE(fixture, "resolver detects self reference") {
  recipe("loop", { { "loop", 1 } });
  auto const err{ resolve_error("loop") };
  CHECK(err.kind() == larder::error_kind::CIRCULAR_DEPENDENCY);
  CHECK(std::string{ err.what() } == "circular dependency detected: loop -> loop");
  CHECK(cache.size() == 0);
}

TEST_CASE_FIXTURE(fixture, "resolver detects multi-step cycles") {
  ingredient("salt", 1);
  recipe("a", { { "salt", 1 }, { "b", 1 } });
  recipe("b", { { "c", 1 } });
  recipe("c", { { "a", 2 } });

  auto const err{ resolve_error("a") };
  CHECK(err.kind() == larder::error_kind::CIRCULAR_DEPENDENCY);
  CHECK(std::string{ err.what() } == "circular dependency detected: a -> b -> c -> a");
  CHECK(cache.size() == 0);

  auto const from_b{ resolve_error("b") };
  CHECK(std::string{ from_b.what() } == "circular dependency detected: b -> c -> a -> b");
}

TEST_CASE_FIXTURE(fixture, "resolver reports unknown items without caching") {
  ingredient("egg", 1);
  recipe("inner", { { "egg", 1 }, { "phantom", 1 } });
  recipe("outer", { { "inner", 2 } });

  auto const err{ resolve_error("outer") };
  CHECK(err.kind() == larder::error_kind::UNKNOWN_ITEM);
  CHECK(std::string{ err.what() } == "recipe 'inner' requires unknown item 'phantom'");
  CHECK(cache.size() == 0);
}

TEST_CASE_FIXTURE(fixture, "resolver fails when scaled quantities overflow") {
  ingredient("egg", 1);
  recipe("inner", { { "egg", 10000000000 } });
  recipe("outer", { { "inner", 10000000000 } });

  auto const err{ resolve_error("outer") };
  CHECK(err.kind() == larder::error_kind::QUANTITY_OVERFLOW);
  CHECK(std::string{ err.what() } == "quantity of 'egg' in recipe 'outer' overflows");
  CHECK(cache.count("outer") == 0);
  CHECK(cache.count("inner") == 1);
}

TEST_CASE_FIXTURE(fixture, "resolver fails when summed quantities overflow") {
  ingredient("egg", 1);
  recipe("left", { { "egg", 4611686018427387904 } });
  recipe("right", { { "egg", 4611686018427387904 } });
  recipe("both", { { "left", 1 }, { "right", 1 } });

  CHECK(resolve_error("both").kind() == larder::error_kind::QUANTITY_OVERFLOW);
  CHECK(cache.count("both") == 0);

  larder::resolver r{ entries, cache };
  CHECK(r.resolve(get("left")) ==
        larder::frequency_map_t{ { "egg", 4611686018427387904 } });
}

TEST_CASE_FIXTURE(fixture, "resolver does not flag diamonds as cycles") {
  ingredient("x", 1);
  recipe("d", { { "x", 1 } });
  recipe("b", { { "d", 1 } });
  recipe("c", { { "d", 1 } });
  recipe("a", { { "b", 1 }, { "c", 1 } });

  larder::resolver r{ entries, cache };
  CHECK(r.resolve(get("a")) == larder::frequency_map_t{ { "x", 2 } });
}

TEST_CASE("resolver_validate_cycle") {
  std::vector<std::string> const path{ "a", "b", "c" };
  CHECK_NOTHROW(larder::resolver_validate_cycle("d", path));
  CHECK_NOTHROW(larder::resolver_validate_cycle("a", {}));
  CHECK_THROWS_WITH_AS(larder::resolver_validate_cycle("b", path),
                       "circular dependency detected: b -> c -> b",
                       larder::cookbook_error);
}
