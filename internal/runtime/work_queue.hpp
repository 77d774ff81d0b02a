#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace txcluster::runtime {

/*
  Thread-safe bounded blocking queue.

  Push blocks while the queue holds `capacity` items, so a fast producer is
  throttled to its consumers. After Shutdown(), Push drops its item and
  returns false; Pop drains what is left, then returns std::nullopt.
*/
template <typename T>
class WorkQueue {
 public:
  explicit WorkQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
  }

  WorkQueue(const WorkQueue&)            = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;

  bool Push(T item) {
    {
      std::unique_lock lock(mutex_);
      not_full_.wait(lock, [&] { return shutdown_ || queue_.size() < capacity_; });
      if (shutdown_) return false;
      queue_.push(std::move(item));
    }
    not_empty_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Pop() {
    std::unique_lock lock(mutex_);

    not_empty_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

 private:
  const std::size_t       capacity_;
  std::mutex              mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<T>           queue_;
  bool                    shutdown_ = false;
};

} // namespace txcluster::runtime
