/**
 * @file test_scheduler.cpp
 * @brief Tests for scheduler.hpp
 */

#include "mwd/scheduler.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

mwd::ServiceDefinition Def(const std::string& name, const std::string& category,
                           const std::string& stage, const std::string& accepts,
                           const std::string& rejects = "") {
  mwd::ServiceDefinition d;
  d.name = name;
  d.category = category;
  d.stage = stage;
  d.accepts = accepts;
  d.rejects = rejects;
  return d;
}

struct SchedulerEnv {
  SchedulerEnv()
      : cache(mwd::StaticRegistrySource(
                  {Def("strings", "static", "pre", ".*"),
                   Def("pe", "static", "core", "executable/.*"),
                   Def("sandbox", "dynamic", "core", "executable/.*",
                       "executable/linux.*"),
                   Def("meta", "system", "post", ".*")},
                  {"pre", "core", "post"}),
              0U),
        scheduler(Config(), cache) {}

  static mwd::DispatchConfig Config() {
    mwd::DispatchConfig cfg;
    cfg.stages = {"pre", "core", "post"};
    return cfg;
  }

  mwd::RegistryCache cache;
  mwd::Scheduler scheduler;
};

std::vector<std::string> Names(const std::map<std::string, mwd::ServicePtr>& bucket) {
  std::vector<std::string> out;
  for (const auto& kv : bucket) out.push_back(kv.first);
  return out;
}

}  // namespace

TEST_CASE("Scheduler with no selection takes every matching service",
          "[scheduler]") {
  SchedulerEnv env;
  mwd::Submission s;
  s.sid = "s1";
  auto schedule = env.scheduler.BuildSchedule(s, "executable/windows");
  REQUIRE(schedule.stage_names == std::vector<std::string>{"pre", "core", "post"});
  REQUIRE(schedule.buckets.size() == 3U);
  REQUIRE(Names(schedule.buckets[0]) == std::vector<std::string>{"strings"});
  REQUIRE(Names(schedule.buckets[1]) == std::vector<std::string>{"pe", "sandbox"});
  REQUIRE(Names(schedule.buckets[2]) == std::vector<std::string>{"meta"});
  REQUIRE(schedule.ServiceCount() == 4U);
}

TEST_CASE("Scheduler filters by file type and keeps empty stages", "[scheduler]") {
  SchedulerEnv env;
  mwd::Submission s;
  s.sid = "s1";
  s.selected_categories = {"static"};
  auto report = env.scheduler.BuildScheduleWithReport(s, "text");
  REQUIRE(report.schedule.buckets.size() == 3U);
  REQUIRE(Names(report.schedule.buckets[0]) == std::vector<std::string>{"strings"});
  REQUIRE(report.schedule.buckets[1].empty());
  REQUIRE(Names(report.schedule.buckets[2]) == std::vector<std::string>{"meta"});
  REQUIRE(report.skipped == std::vector<std::string>{"pe"});
}

TEST_CASE("Scheduler exclusions never remove system services", "[scheduler]") {
  SchedulerEnv env;
  mwd::Submission s;
  s.sid = "s1";
  s.excluded_categories = {"static", "meta"};
  auto report = env.scheduler.BuildScheduleWithReport(s, "executable/linux-elf");
  REQUIRE(report.schedule.buckets[0].empty());
  REQUIRE(report.schedule.buckets[1].empty());
  REQUIRE(Names(report.schedule.buckets[2]) == std::vector<std::string>{"meta"});
  REQUIRE(report.skipped == std::vector<std::string>{"sandbox"});
}

TEST_CASE("Scheduler ignores exclusion of the system category", "[scheduler]") {
  SchedulerEnv env;
  mwd::Submission s;
  s.sid = "s1";
  s.excluded_categories = {"system", "dynamic"};
  auto schedule = env.scheduler.BuildSchedule(s, "executable/windows");
  REQUIRE(Names(schedule.buckets[0]) == std::vector<std::string>{"strings"});
  REQUIRE(Names(schedule.buckets[1]) == std::vector<std::string>{"pe"});
  REQUIRE(Names(schedule.buckets[2]) == std::vector<std::string>{"meta"});
}

TEST_CASE("Scheduler skips unregistered selections", "[scheduler]") {
  SchedulerEnv env;
  mwd::Submission s;
  s.sid = "s1";
  s.selected_categories = {"ghost", "pe"};
  auto report = env.scheduler.BuildScheduleWithReport(s, "executable/windows");
  REQUIRE(report.schedule.ServiceCount() == 2U);
  REQUIRE(report.skipped == std::vector<std::string>{"ghost"});
}

TEST_CASE("Scheduler with nothing accepting the type is empty", "[scheduler]") {
  mwd::RegistryCache cache(
      mwd::StaticRegistrySource({Def("pe", "static", "core", "executable/.*")},
                                {"pre", "core", "post"}),
      0U);
  mwd::Scheduler scheduler(SchedulerEnv::Config(), cache);
  mwd::Submission s;
  s.sid = "s1";
  auto schedule = scheduler.BuildSchedule(s, "image/png");
  REQUIRE(schedule.Empty());
  REQUIRE(schedule.buckets.size() == 3U);
}

TEST_CASE("Scheduler stage index and result keys", "[scheduler]") {
  SchedulerEnv env;
  REQUIRE(env.scheduler.StageIndex("core").value() == 1U);
  auto missing = env.scheduler.StageIndex("nope");
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == mwd::RegistryError::kUnknownStage);

  auto key = env.scheduler.BuildResultKey("abc", "pe", "h1");
  REQUIRE(key.has_value());
  REQUIRE(key.value() == "abc.pe.v0.ch1");
  auto unknown = env.scheduler.BuildResultKey("abc", "ghost", "h1");
  REQUIRE(!unknown.has_value());
  REQUIRE(unknown.get_error() == mwd::RegistryError::kNotFound);

  REQUIRE(env.scheduler.Categories().at("static") ==
          std::set<std::string>{"pe", "strings"});
  REQUIRE(env.scheduler.Registry()->Size() == 4U);
}
