#include "concurrency/io_worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace photoreel {
namespace {

using namespace std::chrono_literals;

TEST(IoWorkerPoolTest, Submit_RunsEveryJob) {
  IoWorkerPool             pool(3);
  std::atomic<int>         done{0};
  std::promise<void>       all_done;
  constexpr int            kJobs = 64;
  for (int i = 0; i < kJobs; ++i) {
    ASSERT_TRUE(pool.Submit([&]() {
      if (++done == kJobs) {
        all_done.set_value();
      }
    }));
  }
  ASSERT_EQ(all_done.get_future().wait_for(5s), std::future_status::ready);
  EXPECT_EQ(done.load(), kJobs);
}

TEST(IoWorkerPoolTest, Shutdown_DropsQueuedJobsAndRejectsNewOnes) {
  IoWorkerPool       pool(1);
  std::promise<void> started;
  std::promise<void> release;
  auto               release_future = release.get_future().share();
  std::atomic<int>   ran{0};

  pool.Submit([&started, release_future]() {
    started.set_value();
    release_future.wait();
  });
  started.get_future().wait();
  for (int i = 0; i < 5; ++i) {
    pool.Submit([&ran]() { ++ran; });
  }
  EXPECT_EQ(pool.PendingJobs(), 5u);

  std::thread releaser([&release]() {
    std::this_thread::sleep_for(20ms);
    release.set_value();
  });
  pool.Shutdown();
  releaser.join();

  EXPECT_EQ(ran.load(), 0);
  EXPECT_EQ(pool.PendingJobs(), 0u);
  EXPECT_FALSE(pool.Submit([]() {}));
}

}  // namespace
}  // namespace photoreel
