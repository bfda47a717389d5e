#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

// Unbounded FIFO shared between task producers and pool workers.
template <typename T> class ThreadSafeQueue {
public:
  // Returns false once the queue is closed; the value is dropped
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return false;
      items_.push(std::move(value));
    }
    cond_.notify_one();
    return true;
  }

  // Blocks until an item arrives. Returns false when closed and drained.
  bool wait_and_pop(T &value) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return !items_.empty() || closed_; });
    if (items_.empty())
      return false;

    value = std::move(items_.front());
    items_.pop();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cond_.notify_all();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

private:
  mutable std::mutex mutex_;
  std::queue<T> items_;
  std::condition_variable cond_;
  bool closed_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
