#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace replication {

// Fixed-size pool. The destructor runs every queued task and joins the threads.
// Tasks must not block on futures of other tasks in the same pool.
class WorkerPool {
 public:
  // Starts one thread running the given loop. Throws std::system_error when the
  // thread cannot be created.
  using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

  explicit WorkerPool(size_t threads, ThreadLauncher launch = LaunchThread);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  size_t Size() const { return threads_.size(); }

  template <typename F>
  std::future<std::invoke_result_t<F>> Submit(F fn) {
    using R = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> fut = task->get_future();
    Enqueue([task] { (*task)(); });
    return fut;
  }

 private:
  static std::thread LaunchThread(std::function<void()> loop) { return std::thread(std::move(loop)); }

  void StopAndJoin();
  void Enqueue(std::function<void()> task);
  void WorkerLoop();

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool stopping_ = false;
  std::vector<std::thread> threads_;
};

// Barrier: waits for every future before surfacing the first failure, so no
// task is still running against caller-owned state when this throws.
void WaitAll(std::vector<std::future<void>>& futures);

template <typename T>
std::vector<T> CollectAll(std::vector<std::future<T>>& futures) {
  for (auto& f : futures) f.wait();
  std::vector<T> out;
  out.reserve(futures.size());
  for (auto& f : futures) out.push_back(f.get());
  return out;
}

}  // namespace replication
