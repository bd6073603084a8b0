/**
 * @file test_expiry.cpp
 * @brief Tests for expiry.hpp
 */

#include "mwd/expiry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using nlohmann::json;

namespace {

/// Blob store whose deletes always fail with an I/O error.
class BrokenObjectStore final : public mwd::ObjectStore {
 public:
  mwd::expected<void, mwd::StoreError> Upload(const std::string&,
                                              const std::string&) override {
    return mwd::expected<void, mwd::StoreError>::error(mwd::StoreError::kIoError);
  }
  mwd::expected<void, mwd::StoreError> Download(const std::string&,
                                                const std::string&) override {
    return mwd::expected<void, mwd::StoreError>::error(mwd::StoreError::kIoError);
  }
  mwd::expected<void, mwd::StoreError> Delete(const std::string&) override {
    return mwd::expected<void, mwd::StoreError>::error(mwd::StoreError::kIoError);
  }
  bool Exists(const std::string&) const override { return true; }
};

void Put(mwd::Collection& c, const std::string& id, const json& expiry) {
  json doc = {{"id", id}};
  doc["expiry_ts"] = expiry;
  REQUIRE(c.Save(id, doc).has_value());
}

mwd::ExpiryConfig Config() {
  mwd::ExpiryConfig cfg;
  cfg.delay_hours = 0U;
  cfg.batch_delete = false;
  cfg.delete_storage = true;
  cfg.workers = 2U;
  return cfg;
}

}  // namespace

TEST_CASE("ExpiryManager deadline", "[expiry]") {
  auto ds = mwd::Datastore::InMemory();
  auto cfg = Config();
  {
    mwd::ExpiryManager m(cfg, ds, nullptr, nullptr);
    REQUIRE(m.Deadline(100000) == 100000);
  }
  cfg.delay_hours = 2U;
  {
    mwd::ExpiryManager m(cfg, ds, nullptr, nullptr);
    REQUIRE(m.Deadline(100000) == 100000 - 7200);
  }
  cfg.delay_hours = 0U;
  cfg.batch_delete = true;
  {
    mwd::ExpiryManager m(cfg, ds, nullptr, nullptr);
    REQUIRE(m.Deadline(2 * 86400 + 500) == 2 * 86400);
    REQUIRE(m.Deadline(2 * 86400) == 2 * 86400);
  }
}

TEST_CASE("ExpiryManager deletes expired records and blobs", "[expiry]") {
  auto ds = mwd::Datastore::InMemory();
  mwd::MemoryObjectStore filestore;
  mwd::MemoryObjectStore cachestore;

  Put(*ds.submission, "s1", 100);
  Put(*ds.submission, "s2", 5000);
  Put(*ds.submission, "s3", nullptr);
  Put(*ds.file, "f1", 100);
  Put(*ds.file, "f2", 1000);
  Put(*ds.file, "f3", 9999);
  Put(*ds.result, "r1", 50);
  Put(*ds.cached_file, "c1", 10);
  Put(*ds.service, "svc", 1);

  filestore.Put("f1", "one");
  filestore.Put("f3", "three");  // f2's blob is already gone.
  cachestore.Put("c1", "cached");

  mwd::ExpiryManager m(Config(), ds, &filestore, &cachestore);
  auto report = m.RunOnce(1000);

  REQUIRE(report.skipped.empty());
  REQUIRE(report.deleted.at("submission") == 1U);
  REQUIRE(report.deleted.at("file") == 2U);
  REQUIRE(report.deleted.at("result") == 1U);
  REQUIRE(report.deleted.at("cached_file") == 1U);
  REQUIRE(report.deleted.count("error") == 0U);
  REQUIRE(report.blobs_deleted.at("file") == 2U);
  REQUIRE(report.blobs_deleted.at("cached_file") == 1U);

  REQUIRE(!ds.submission->Exists("s1"));
  REQUIRE(ds.submission->Exists("s2"));
  REQUIRE(ds.submission->Exists("s3"));
  REQUIRE(ds.file->Exists("f3"));
  REQUIRE(ds.service->Exists("svc"));
  REQUIRE(!filestore.Exists("f1"));
  REQUIRE(filestore.Exists("f3"));
  REQUIRE(cachestore.Size() == 0U);
  REQUIRE(m.TotalDeleted() == 5U);

  auto second = m.RunOnce(1000);
  REQUIRE(second.deleted.empty());
  REQUIRE(m.TotalDeleted() == 5U);
}

TEST_CASE("ExpiryManager keeps records when blob deletion fails", "[expiry]") {
  auto ds = mwd::Datastore::InMemory();
  BrokenObjectStore broken;
  Put(*ds.file, "f1", 10);
  Put(*ds.result, "r1", 10);

  mwd::ExpiryManager m(Config(), ds, &broken, nullptr);
  auto report = m.RunOnce(1000);
  REQUIRE(report.skipped == std::vector<std::string>{"file"});
  REQUIRE(ds.file->Exists("f1"));
  REQUIRE(!ds.result->Exists("r1"));
  REQUIRE(report.deleted.at("result") == 1U);
}

TEST_CASE("ExpiryManager without storage deletion leaves blobs", "[expiry]") {
  auto ds = mwd::Datastore::InMemory();
  mwd::MemoryObjectStore filestore;
  Put(*ds.file, "f1", 10);
  filestore.Put("f1", "x");

  auto cfg = Config();
  cfg.delete_storage = false;
  mwd::ExpiryManager m(cfg, ds, &filestore, nullptr);
  auto report = m.RunOnce(1000);
  REQUIRE(report.deleted.at("file") == 1U);
  REQUIRE(report.blobs_deleted.empty());
  REQUIRE(filestore.Exists("f1"));
}

TEST_CASE("ExpiryManager batch delete waits for the day boundary", "[expiry]") {
  auto ds = mwd::Datastore::InMemory();
  Put(*ds.result, "r1", 86400 + 10);
  auto cfg = Config();
  cfg.batch_delete = true;
  mwd::ExpiryManager m(cfg, ds, nullptr, nullptr);

  REQUIRE(m.RunOnce(86400 + 20).deleted.empty());
  REQUIRE(ds.result->Exists("r1"));
  REQUIRE(m.RunOnce(2 * 86400).deleted.at("result") == 1U);
}

TEST_CASE("ExpiryManager background start and stop", "[expiry]") {
  auto ds = mwd::Datastore::InMemory();
  auto cfg = Config();
  cfg.sleep_time_s = 1U;
  mwd::ExpiryManager m(cfg, ds, nullptr, nullptr);
  REQUIRE(m.Start().has_value());
  REQUIRE(m.IsRunning());

  auto again = m.Start();
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == mwd::TimerError::kAlreadyRunning);
  REQUIRE(m.ScheduledTasks() == 1U);

  m.Stop();
  m.Stop();
  REQUIRE(!m.IsRunning());

  // A restart reuses the sweep task.
  REQUIRE(m.Start().has_value());
  REQUIRE(m.ScheduledTasks() == 1U);
  m.Stop();
}

TEST_CASE("ExpiryManager accepts a sleep time beyond 32-bit milliseconds",
          "[expiry]") {
  auto ds = mwd::Datastore::InMemory();
  auto cfg = Config();
  // 536870912 s is 2^32 * 125 ms, which wraps to zero in 32 bits.
  cfg.sleep_time_s = 536870912U;
  mwd::ExpiryManager m(cfg, ds, nullptr, nullptr);
  REQUIRE(m.Start().has_value());
  REQUIRE(m.ScheduledTasks() == 1U);
  m.Stop();
}
