/**
 * @file test_datastore.cpp
 * @brief Tests for datastore.hpp
 */

#include "mwd/datastore.hpp"

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

using nlohmann::json;

TEST_CASE("Query match-all and equality", "[datastore][query]") {
  REQUIRE(mwd::Query::All().IsMatchAll());
  REQUIRE(mwd::Query::All().Matches(json{{"x", 1}}));

  mwd::Query q;
  q.Equals("status", "complete").Equals("archived", false);
  REQUIRE(!q.IsMatchAll());
  REQUIRE(q.Matches(json{{"status", "complete"}, {"archived", false}}));
  REQUIRE(!q.Matches(json{{"status", "complete"}, {"archived", true}}));
  REQUIRE(!q.Matches(json{{"status", "complete"}}));
}

TEST_CASE("Query range ignores null and missing fields", "[datastore][query]") {
  mwd::Query q;
  q.Range("expiry_ts", std::nullopt, 100.0);
  REQUIRE(q.Matches(json{{"expiry_ts", 100}}));
  REQUIRE(q.Matches(json{{"expiry_ts", -5}}));
  REQUIRE(!q.Matches(json{{"expiry_ts", 101}}));
  REQUIRE(!q.Matches(json{{"expiry_ts", nullptr}}));
  REQUIRE(!q.Matches(json{{"other", 1}}));
  REQUIRE(!q.Matches(json{{"expiry_ts", "50"}}));

  mwd::Query bounded;
  bounded.Range("n", 10.0, 20.0);
  REQUIRE(bounded.Matches(json{{"n", 10}}));
  REQUIRE(bounded.Matches(json{{"n", 15.5}}));
  REQUIRE(!bounded.Matches(json{{"n", 9}}));
}

TEST_CASE("MemoryCollection CRUD", "[datastore]") {
  mwd::MemoryCollection c("result");
  REQUIRE(c.Name() == "result");

  auto missing = c.Get("k");
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == mwd::StoreError::kNotFound);

  REQUIRE(c.Save("k", json{{"v", 1}}).has_value());
  REQUIRE(c.Exists("k"));
  REQUIRE(c.Get("k").value()["v"] == 1);

  REQUIRE(c.Save("k", json{{"v", 2}}).has_value());
  REQUIRE(c.Get("k").value()["v"] == 2);
  REQUIRE(c.Count(mwd::Query::All()) == 1U);

  auto bad = c.Save("x", json::array({1}));
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error() == mwd::StoreError::kInvalidRecord);

  REQUIRE(c.Delete("k").has_value());
  REQUIRE(!c.Exists("k"));
  REQUIRE(c.Delete("k").get_error() == mwd::StoreError::kNotFound);
}

TEST_CASE("MemoryCollection search, count and delete matching", "[datastore]") {
  mwd::MemoryCollection c("file");
  for (int i = 0; i < 10; ++i) {
    json doc = {{"n", i}};
    doc["expiry_ts"] = (i % 2 == 0) ? json(i * 10) : json(nullptr);
    REQUIRE(c.Save("f" + std::to_string(i), doc).has_value());
  }
  mwd::Query due;
  due.Range("expiry_ts", std::nullopt, 40.0);

  REQUIRE(c.Count(due) == 3U);
  auto docs = c.Search(due);
  REQUIRE(docs.size() == 3U);
  REQUIRE(docs[0].id == "f0");
  REQUIRE(docs[2].id == "f4");

  REQUIRE(c.DeleteMatching(due) == 3U);
  REQUIRE(c.Count(mwd::Query::All()) == 7U);
  REQUIRE(c.Count(due) == 0U);
}

TEST_CASE("SaveRecord and LoadRecord", "[datastore]") {
  mwd::MemoryCollection c("submission");
  mwd::Submission s;
  s.sid = "s1";
  s.files.push_back(mwd::FileInfo{"aa", "exe/pe", "a.exe"});
  s.expiry_ts = 1234;
  REQUIRE(mwd::SaveRecord(c, s.sid, s).has_value());

  auto back = mwd::LoadRecord<mwd::Submission>(c, "s1");
  REQUIRE(back.has_value());
  REQUIRE(back.value().files.size() == 1U);
  REQUIRE(back.value().files[0] == s.files[0]);
  REQUIRE(back.value().expiry_ts.value() == 1234);
  REQUIRE(back.value().status == mwd::SubmissionStatus::kIncomplete);

  REQUIRE(c.Save("bad", json{{"files", 3}}).has_value());
  auto bad = mwd::LoadRecord<mwd::Submission>(c, "bad");
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error() == mwd::StoreError::kInvalidRecord);

  REQUIRE(mwd::LoadRecord<mwd::Submission>(c, "nope").get_error() ==
          mwd::StoreError::kNotFound);
}

TEST_CASE("Datastore InMemory wiring", "[datastore]") {
  auto ds = mwd::Datastore::InMemory();
  REQUIRE(ds.submission->Name() == "submission");
  REQUIRE(ds.result_archive->Name() == "result_archive");

  auto expirable = ds.ExpirableCollections();
  REQUIRE(expirable.size() == 5U);
  for (const auto& c : expirable) {
    REQUIRE(c->Name() != "service");
    REQUIRE(c->Name().find("archive") == std::string::npos);
  }
}

TEST_CASE("MemoryCollection concurrent writers", "[datastore]") {
  mwd::MemoryCollection c("result");
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&c, t] {
      for (int i = 0; i < 100; ++i) {
        (void)c.Save(std::to_string(t) + "-" + std::to_string(i), json{{"i", i}});
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(c.Count(mwd::Query::All()) == 400U);
}
