//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "concurrency/io_worker_pool.hpp"

#include <algorithm>

namespace photoreel {

IoWorkerPool::IoWorkerPool(size_t thread_count) {
  const size_t count = std::max<size_t>(1, thread_count);
  workers_.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { Run(); });
  }
}

IoWorkerPool::~IoWorkerPool() { Shutdown(); }

auto IoWorkerPool::Submit(std::function<void()> job) -> bool {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) {
      return false;
    }
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

void IoWorkerPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_ && workers_.empty()) {
      return;
    }
    stopping_ = true;
    jobs_.clear();
  }
  cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

auto IoWorkerPool::PendingJobs() const -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return jobs_.size();
}

void IoWorkerPool::Run() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (stopping_) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    job();
  }
}
};  // namespace photoreel
