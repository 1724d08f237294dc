#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace photoreel {

/// Fixed set of worker threads for blocking fetches. Pending jobs are dropped on Shutdown().
class IoWorkerPool {
 public:
  explicit IoWorkerPool(size_t thread_count);
  ~IoWorkerPool();

  IoWorkerPool(const IoWorkerPool&)            = delete;
  IoWorkerPool& operator=(const IoWorkerPool&) = delete;

  // Returns false once the pool has been shut down.
  auto Submit(std::function<void()> job) -> bool;
  void Shutdown();
  auto PendingJobs() const -> size_t;

 private:
  void                              Run();

  std::deque<std::function<void()>> jobs_;
  mutable std::mutex                mtx_;
  std::condition_variable           cv_;
  std::vector<std::thread>          workers_;
  bool                              stopping_ = false;
};
};  // namespace photoreel
