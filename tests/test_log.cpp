/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "mwd/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(mwd::log::GetLevel() == mwd::log::Level::kInfo);
#else
  REQUIRE(mwd::log::GetLevel() == mwd::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = mwd::log::GetLevel();
  mwd::log::SetLevel(mwd::log::Level::kError);
  REQUIRE(mwd::log::GetLevel() == mwd::log::Level::kError);
  mwd::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  auto prev = mwd::log::GetLevel();
  REQUIRE(!mwd::log::IsInitialized());
  mwd::log::Init(mwd::log::Level::kWarn);
  REQUIRE(mwd::log::IsInitialized());
  REQUIRE(mwd::log::GetLevel() == mwd::log::Level::kWarn);
  mwd::log::Shutdown();
  REQUIRE(!mwd::log::IsInitialized());
  mwd::log::SetLevel(prev);
}

TEST_CASE("Log ParseLevel", "[log]") {
  using mwd::log::Level;
  REQUIRE(mwd::log::ParseLevel("debug", Level::kOff) == Level::kDebug);
  REQUIRE(mwd::log::ParseLevel("INFO", Level::kOff) == Level::kInfo);
  REQUIRE(mwd::log::ParseLevel("Warning", Level::kOff) == Level::kWarn);
  REQUIRE(mwd::log::ParseLevel("error", Level::kOff) == Level::kError);
  REQUIRE(mwd::log::ParseLevel("off", Level::kInfo) == Level::kOff);
  REQUIRE(mwd::log::ParseLevel("verbose", Level::kInfo) == Level::kInfo);
  REQUIRE(mwd::log::ParseLevel("", Level::kWarn) == Level::kWarn);
  REQUIRE(mwd::log::ParseLevel(nullptr, Level::kError) == Level::kError);
}

TEST_CASE("Log macros compile and run", "[log]") {
  mwd::log::SetLevel(mwd::log::Level::kDebug);
  MWD_LOG_DEBUG("Test", "debug %d", 1);
  MWD_LOG_INFO("Test", "info %s", "msg");
  MWD_LOG_WARN("Test", "warn");
  MWD_LOG_ERROR("Test", "error %d %d", 1, 2);
  // FATAL aborts.
  REQUIRE(true);
}

TEST_CASE("Log runtime level filtering", "[log]") {
  mwd::log::SetLevel(mwd::log::Level::kOff);
  MWD_LOG_DEBUG("Test", "should not appear");
  MWD_LOG_ERROR("Test", "should not appear");
  mwd::log::SetLevel(mwd::log::Level::kDebug);
  REQUIRE(true);
}

TEST_CASE("Log with very long message", "[log]") {
  mwd::log::SetLevel(mwd::log::Level::kDebug);
  std::string long_msg(300, 'x');
  MWD_LOG_INFO("Test", "%s", long_msg.c_str());
  MWD_LOG_DEBUG("Test", "Long: %s %s %s", long_msg.c_str(), long_msg.c_str(),
                long_msg.c_str());
  REQUIRE(true);
}

TEST_CASE("Log from concurrent threads", "[log]") {
  mwd::log::SetLevel(mwd::log::Level::kDebug);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t] {
      for (int i = 0; i < 20; ++i) MWD_LOG_DEBUG("Test", "thread %d line %d", t, i);
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(true);
}
