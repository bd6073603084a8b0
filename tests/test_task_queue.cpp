/**
 * @file test_task_queue.cpp
 * @brief Tests for task_queue.hpp
 */

#include "mwd/task_queue.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("NamedQueue FIFO order", "[task_queue]") {
  mwd::NamedQueue<int> q("q");
  REQUIRE(q.Name() == "q");
  for (int i = 0; i < 5; ++i) REQUIRE(q.Push(i).has_value());
  REQUIRE(q.Size() == 5U);
  for (int i = 0; i < 5; ++i) REQUIRE(q.Pop(0U).value() == i);
  REQUIRE(!q.Pop(0U).has_value());
}

TEST_CASE("NamedQueue Pop times out", "[task_queue]") {
  mwd::NamedQueue<int> q("q");
  const uint64_t start = mwd::SteadyNowMs();
  REQUIRE(!q.Pop(20U).has_value());
  REQUIRE(mwd::SteadyNowMs() - start >= 15U);
}

TEST_CASE("NamedQueue wakes a blocked consumer", "[task_queue]") {
  mwd::NamedQueue<std::string> q("q");
  std::optional<std::string> got;
  std::thread consumer([&] { got = q.Pop(5000U); });
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  REQUIRE(q.Push("hello").has_value());
  consumer.join();
  REQUIRE(got.value() == "hello");
}

TEST_CASE("NamedQueue Close drains then rejects", "[task_queue]") {
  mwd::NamedQueue<int> q("q");
  REQUIRE(q.Push(1).has_value());
  q.Close();
  REQUIRE(q.IsClosed());

  auto r = q.Push(2);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mwd::QueueError::kClosed);

  REQUIRE(q.Pop(1000U).value() == 1);
  const uint64_t start = mwd::SteadyNowMs();
  REQUIRE(!q.Pop(1000U).has_value());
  REQUIRE(mwd::SteadyNowMs() - start < 500U);
}

TEST_CASE("NamedQueue PopAll", "[task_queue]") {
  mwd::NamedQueue<int> q("q");
  REQUIRE(q.PopAll().empty());
  (void)q.Push(1);
  (void)q.Push(2);
  auto all = q.PopAll();
  REQUIRE(all == std::vector<int>{1, 2});
  REQUIRE(q.Size() == 0U);
}

TEST_CASE("QueueHub returns one queue per name", "[task_queue]") {
  mwd::QueueHub<int> hub;
  auto a = hub.ForService("extract");
  auto b = hub.Get("service-queue-extract");
  REQUIRE(a == b);
  REQUIRE(a->Name() == mwd::ServiceQueueName("extract"));
  REQUIRE(hub.Get("other") != a);
  REQUIRE(hub.Names().size() == 2U);

  hub.CloseAll();
  REQUIRE(a->IsClosed());
  REQUIRE(hub.Get("other")->IsClosed());
}
