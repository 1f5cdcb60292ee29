#ifndef TACET_THREAD_POOL_H_
#define TACET_THREAD_POOL_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed-size worker pool for CPU-bound redaction calls
// - FIFO task queue
// - Submit() returns a future for the task result
// - Shutdown() drains queued tasks, then joins the workers

namespace Tacet {

struct TaskMetrics {
  std::atomic<uint64_t> tasks_submitted{0};
  std::atomic<uint64_t> tasks_completed{0};
};

class ThreadPool {
public:
  // Create thread pool with specified number of workers
  // If num_threads = 0, uses hardware_concurrency (CPU-bound work)
  explicit ThreadPool(size_t num_threads = 0);
  ~ThreadPool();

  // Non-copyable, non-movable
  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // Submit a task, returns future for result. After Shutdown() the task is
  // dropped and the future reports std::future_errc::broken_promise.
  template<typename F, typename... Args>
  auto Submit(F&& f, Args&&... args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  // Shutdown the pool (waits for all queued tasks to complete)
  void Shutdown();

  const TaskMetrics& GetMetrics() const { return metrics_; }

  size_t GetWorkerCount() const { return worker_count_; }
  size_t GetQueueSize() const;
  bool IsShutdown() const { return shutdown_.load(std::memory_order_acquire); }

private:
  void WorkerLoop();

  std::vector<std::thread> workers_;
  size_t worker_count_;

  std::queue<std::function<void()>> tasks_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;

  std::atomic<bool> shutdown_{false};

  TaskMetrics metrics_;
};

// ============================================================
// Template Implementations
// ============================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...)
  );

  std::future<return_type> result = task->get_future();

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      // |task| is released here without running: the future becomes ready
      // with broken_promise
      return result;
    }

    tasks_.push([task]() { (*task)(); });
  }

  metrics_.tasks_submitted.fetch_add(1, std::memory_order_relaxed);
  queue_cv_.notify_one();
  return result;
}

}  // namespace Tacet

#endif  // TACET_THREAD_POOL_H_
