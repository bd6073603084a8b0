/**
 * @file test_dispatch_config.cpp
 * @brief Tests for dispatch_config.hpp
 */

#include "mwd/dispatch_config.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("LoadDispatchConfig defaults", "[dispatch_config]") {
  mwd::ConfigStore store;
  auto r = mwd::LoadDispatchConfig(store);
  REQUIRE(r.has_value());
  const auto& cfg = r.value();
  REQUIRE(cfg.stages.size() == 3U);
  REQUIRE(cfg.stages[0] == "pre");
  REQUIRE(cfg.system_category == "system");
  REQUIRE(cfg.shards == 2U);
  REQUIRE(cfg.max_extraction_depth == 6U);
  REQUIRE(cfg.retry.base_ms == 500U);
  REQUIRE(cfg.expiry.delete_storage);
  REQUIRE(!cfg.expiry.batch_delete);
  REQUIRE(cfg.archive.queue == "m-archive");
  REQUIRE(cfg.categories.empty());
  REQUIRE(cfg.log_level == mwd::log::Level::kInfo);
}

TEST_CASE("LoadDispatchConfig reads every section", "[dispatch_config]") {
  mwd::ConfigStore store;
  store.Set("core", "stages", "X, Y");
  store.Set("core", "system_category", "sys");
  store.Set("core", "registry_refresh_ms", "0");
  store.Set("core", "max_extraction_depth", "2");
  store.Set("core", "log_level", "debug");
  store.Set("dispatcher", "shards", "8");
  store.Set("retry", "base_ms", "0");
  store.Set("retry", "max_ms", "100");
  store.Set("expiry", "delay_hours", "24");
  store.Set("expiry", "batch_delete", "yes");
  store.Set("expiry", "delete_storage", "false");
  store.Set("archive", "queue", "archive-q");
  store.Set("categories", "all", "static, dynamic,");

  auto r = mwd::LoadDispatchConfig(store);
  REQUIRE(r.has_value());
  const auto& cfg = r.value();
  REQUIRE(cfg.stages == std::vector<std::string>{"X", "Y"});
  REQUIRE(cfg.system_category == "sys");
  REQUIRE(cfg.registry_refresh_ms == 0U);
  REQUIRE(cfg.max_extraction_depth == 2U);
  REQUIRE(cfg.log_level == mwd::log::Level::kDebug);
  REQUIRE(cfg.shards == 8U);
  REQUIRE(cfg.retry.base_ms == 0U);
  REQUIRE(cfg.retry.max_ms == 100U);
  REQUIRE(cfg.expiry.delay_hours == 24U);
  REQUIRE(cfg.expiry.batch_delete);
  REQUIRE(!cfg.expiry.delete_storage);
  REQUIRE(cfg.archive.queue == "archive-q");
  REQUIRE(cfg.categories.at("all") ==
          std::vector<std::string>{"static", "dynamic"});
}

TEST_CASE("LoadDispatchConfig rejects bad values", "[dispatch_config]") {
  SECTION("empty stage list") {
    mwd::ConfigStore store;
    store.Set("core", "stages", " , ");
    auto r = mwd::LoadDispatchConfig(store);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == mwd::ConfigError::kInvalidValue);
  }
  SECTION("zero shards") {
    mwd::ConfigStore store;
    store.Set("dispatcher", "shards", "0");
    REQUIRE(!mwd::LoadDispatchConfig(store).has_value());
  }
  SECTION("negative delay") {
    mwd::ConfigStore store;
    store.Set("expiry", "delay_hours", "-1");
    REQUIRE(!mwd::LoadDispatchConfig(store).has_value());
  }
  SECTION("not a number") {
    mwd::ConfigStore store;
    store.Set("retry", "max_ms", "soon");
    auto r = mwd::LoadDispatchConfig(store);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == mwd::ConfigError::kInvalidValue);
  }
}
