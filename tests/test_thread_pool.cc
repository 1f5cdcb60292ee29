#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

#include "util/tacet_thread_pool.h"

using Tacet::ThreadPool;

namespace {

TEST(ThreadPoolTest, RunsTasksAndReturnsResults) {
  ThreadPool pool(4);
  EXPECT_EQ(pool.GetWorkerCount(), 4u);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 100; ++i) {
    futures.push_back(pool.Submit([](int x) { return x * x; }, i));
  }
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(futures[i].get(), i * i);
  }
}

TEST(ThreadPoolTest, ZeroMeansHardwareConcurrency) {
  ThreadPool pool(0);
  EXPECT_GE(pool.GetWorkerCount(), 1u);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
  ThreadPool pool(2);
  std::future<int> failing = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(failing.get(), std::runtime_error);

  // The worker survives the exception
  EXPECT_EQ(pool.Submit([]() { return std::string("still alive"); }).get(), "still alive");
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedTasks) {
  std::atomic<int> completed{0};
  std::vector<std::future<void>> futures;
  {
    ThreadPool pool(1);
    for (int i = 0; i < 50; ++i) {
      futures.push_back(pool.Submit([&completed]() { completed.fetch_add(1); }));
    }
    pool.Shutdown();
    EXPECT_TRUE(pool.IsShutdown());
    EXPECT_EQ(pool.GetQueueSize(), 0u);
    EXPECT_EQ(pool.GetMetrics().tasks_submitted.load(), 50u);
    EXPECT_EQ(pool.GetMetrics().tasks_completed.load(), 50u);
  }
  EXPECT_EQ(completed.load(), 50);
}

TEST(ThreadPoolTest, SubmitAfterShutdownBreaksThePromise) {
  ThreadPool pool(1);
  pool.Shutdown();
  pool.Shutdown();   // idempotent

  std::future<int> future = pool.Submit([]() { return 1; });
  try {
    future.get();
    FAIL() << "expected broken_promise";
  } catch (const std::future_error& e) {
    EXPECT_EQ(e.code(), std::make_error_code(std::future_errc::broken_promise));
  }
  EXPECT_EQ(pool.GetMetrics().tasks_submitted.load(), 0u);
}

}  // namespace
