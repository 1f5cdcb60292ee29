#include "util/tacet_thread_pool.h"
#include <algorithm>

namespace Tacet {

ThreadPool::ThreadPool(size_t num_threads) {
  if (num_threads == 0) {
    num_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
  }

  worker_count_ = num_threads;
  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this);
  }
}

ThreadPool::~ThreadPool() {
  Shutdown();
}

void ThreadPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      return;  // Already shutdown
    }
    shutdown_.store(true, std::memory_order_release);
  }

  queue_cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  workers_.clear();
}

size_t ThreadPool::GetQueueSize() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return tasks_.size();
}

void ThreadPool::WorkerLoop() {
  while (true) {
    std::function<void()> task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);

      // Wait for task or shutdown
      queue_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || !tasks_.empty();
      });

      // Drain remaining tasks before exiting
      if (tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
    }

    // packaged_task stores any exception in the future
    task();
    metrics_.tasks_completed.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace Tacet
