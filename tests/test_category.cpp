/**
 * @file test_category.cpp
 * @brief Tests for category.hpp
 */

#include "mwd/category.hpp"

#include <catch2/catch_test_macros.hpp>

using Categories = std::map<std::string, std::set<std::string>>;

TEST_CASE("ExpandCategories plain service names", "[category]") {
  Categories cats{{"static", {"strings", "pe"}}};
  auto out = mwd::ExpandCategories(std::vector<std::string>{"yara", "av"}, cats);
  REQUIRE(out == std::set<std::string>{"av", "yara"});
}

TEST_CASE("ExpandCategories nested categories", "[category]") {
  Categories cats{
      {"all", {"static", "dynamic"}},
      {"static", {"strings", "pe"}},
      {"dynamic", {"sandbox"}},
  };
  auto out = mwd::ExpandCategories(std::vector<std::string>{"all", "extra"}, cats);
  REQUIRE(out == std::set<std::string>{"extra", "pe", "sandbox", "strings"});
}

TEST_CASE("ExpandCategories terminates on cycles", "[category]") {
  Categories cats{
      {"a", {"b", "svc_a"}},
      {"b", {"a", "svc_b"}},
      {"self", {"self", "svc_self"}},
  };
  auto out = mwd::ExpandCategories(std::vector<std::string>{"a", "self"}, cats);
  REQUIRE(out == std::set<std::string>{"svc_a", "svc_b", "svc_self"});
}

TEST_CASE("ExpandCategories empty and null selectors", "[category]") {
  Categories cats{{"static", {"strings"}}};
  REQUIRE(mwd::ExpandCategories(nullptr, cats).empty());
  REQUIRE(mwd::ExpandCategories(std::vector<std::string>{}, cats).empty());
}

TEST_CASE("ExpandCategories empty category yields nothing", "[category]") {
  Categories cats{{"empty", {}}};
  auto out = mwd::ExpandCategories(std::vector<std::string>{"empty"}, cats);
  REQUIRE(out.empty());
}
