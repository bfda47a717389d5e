#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include "thread_safe_queue.hpp"

#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed-size pool draining a ThreadSafeQueue of tasks. submit() hands back a
// future that resolves with the task's return value or its exception.
class WorkerPool {
public:
  explicit WorkerPool(size_t thread_count) {
    if (thread_count == 0)
      throw std::invalid_argument("Worker pool needs at least one thread");
    workers_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i)
      workers_.emplace_back([this] { run(); });
  }

  ~WorkerPool() { shutdown(); }

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  template <typename F>
  std::future<std::invoke_result_t<F>> submit(F &&task) {
    using Result = std::invoke_result_t<F>;
    auto packaged =
        std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
    std::future<Result> future = packaged->get_future();
    if (!tasks_.push([packaged] { (*packaged)(); }))
      throw std::runtime_error("Worker pool is shut down");
    return future;
  }

  // Queued tasks still run before the workers exit
  void shutdown() {
    tasks_.close();
    for (auto &worker : workers_) {
      if (worker.joinable())
        worker.join();
    }
  }

  size_t size() const { return workers_.size(); }
  size_t pending() const { return tasks_.size(); }

private:
  void run() {
    std::function<void()> task;
    while (tasks_.wait_and_pop(task))
      task();
  }

  ThreadSafeQueue<std::function<void()>> tasks_;
  std::vector<std::thread> workers_;
};

#endif // WORKER_POOL_HPP
