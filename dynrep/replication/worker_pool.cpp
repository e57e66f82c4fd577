#include "worker_pool.h"

#include <algorithm>
#include <utility>

namespace replication {

WorkerPool::WorkerPool(size_t threads, ThreadLauncher launch) {
  threads = std::max<size_t>(1, threads);
  threads_.reserve(threads);
  try {
    for (size_t i = 0; i < threads; ++i) {
      threads_.push_back(launch([this] { WorkerLoop(); }));
    }
  } catch (...) {
    // The destructor does not run for a half-built pool.
    StopAndJoin();
    throw;
  }
}

WorkerPool::~WorkerPool() { StopAndJoin(); }

void WorkerPool::StopAndJoin() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::Enqueue(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void WorkerPool::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return;
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    // packaged_task stores any exception in its future.
    task();
  }
}

void WaitAll(std::vector<std::future<void>>& futures) {
  for (auto& f : futures) f.wait();
  for (auto& f : futures) f.get();
}

}  // namespace replication
