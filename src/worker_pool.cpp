#include <adr/worker_pool.h>

#include <algorithm>
#include <utility>

namespace adr {

WorkerPool::WorkerPool(std::size_t threads) {
  const auto count = std::max<std::size_t>(threads, 1);
  workers_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back(&WorkerPool::WorkerLoop, this);
  }
}

WorkerPool::~WorkerPool() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  for (auto &worker : workers_) {
    worker.join();
  }
}

void WorkerPool::Enqueue(std::function<void()> task) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
}

void WorkerPool::WaitAll() {
  std::unique_lock<std::mutex> lock(mutex_);
  done_cv_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
  if (failure_) {
    auto failure = failure_;
    failure_ = nullptr;
    std::rethrow_exception(failure);
  }
}

void WorkerPool::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
      if (stop_ && tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
      ++active_;
    }

    std::exception_ptr failure;
    try {
      task();
    } catch (...) {
      failure = std::current_exception();
    }

    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (failure && !failure_) {
        failure_ = failure;
      }
      --active_;
    }
    done_cv_.notify_all();
  }
}

void ParallelFor(std::size_t count, std::size_t jobs,
                 const std::function<void(std::size_t)> &body) {
  if (jobs <= 1 || count <= 1) {
    for (std::size_t i = 0; i < count; ++i) {
      body(i);
    }
    return;
  }

  WorkerPool pool(std::min(jobs, count));
  for (std::size_t i = 0; i < count; ++i) {
    pool.Enqueue([&body, i]() { body(i); });
  }
  pool.WaitAll();
}

} // namespace adr
