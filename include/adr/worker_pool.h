#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace adr {

class WorkerPool {
public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  void Enqueue(std::function<void()> task);
  // Blocks until the queue drains; rethrows the first task exception.
  void WaitAll();

  std::size_t Size() const { return workers_.size(); }

private:
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable done_cv_;
  std::size_t active_ = 0;
  bool stop_ = false;
  std::exception_ptr failure_;
};

// Runs body(i) for i in [0, count). Inline when jobs <= 1.
void ParallelFor(std::size_t count, std::size_t jobs,
                 const std::function<void(std::size_t)> &body);

} // namespace adr
