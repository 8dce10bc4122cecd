#include "normalize.h"

#include "error.h"

#include "doctest.h"

TEST_CASE("normalize_name title-cases tokens split on separators") {
  CHECK(larder::normalize_name("meatball_-sandwich") == "Meatball Sandwich");
  CHECK(larder::normalize_name("Riz@z RISO00tto!") == "Rizz Risotto");
  CHECK(larder::normalize_name("skewer") == "Skewer");
  CHECK(larder::normalize_name("BEEF") == "Beef");
}

TEST_CASE("normalize_name collapses separator runs and trims") {
  CHECK(larder::normalize_name("  beef   -- stew__") == "Beef Stew");
  CHECK(larder::normalize_name("a-b_c d") == "A B C D");
}

TEST_CASE("normalize_name drops tokens that lose every letter") {
  CHECK(larder::normalize_name("egg 123 toast") == "Egg Toast");
  CHECK(larder::normalize_name("42-pie") == "Pie");
}

TEST_CASE("normalize_name returns nullopt when nothing survives") {
  SUBCASE("empty") { CHECK_FALSE(larder::normalize_name("").has_value()); }
  SUBCASE("separators only") { CHECK_FALSE(larder::normalize_name(" -_ ").has_value()); }
  SUBCASE("digits and symbols") {
    CHECK_FALSE(larder::normalize_name("123 !@#").has_value());
  }
}

TEST_CASE("normalize_name ignores non-ascii bytes") {
  CHECK(larder::normalize_name("cr\xC3\xA8me brulee") == "Crme Brulee");
}

TEST_CASE("normalize_name is idempotent") {
  for (char const *input : { "meatball_-sandwich", "Riz@z RISO00tto!", "x", "a  b" }) {
    auto const once{ larder::normalize_name(input) };
    REQUIRE(once.has_value());
    CHECK(larder::normalize_name(*once) == once);
  }
}

TEST_CASE("normalize_name_or_throw raises InvalidInput") {
  CHECK(larder::normalize_name_or_throw("hello world") == "Hello World");
  CHECK_THROWS_WITH_AS(larder::normalize_name_or_throw("---"),
                       "Invalid recipe name",
                       larder::cookbook_error);

  try {
    larder::normalize_name_or_throw("");
    FAIL("expected cookbook_error");
  } catch (larder::cookbook_error const &e) {
    CHECK(e.kind() == larder::error_kind::INVALID_INPUT);
  }
}
