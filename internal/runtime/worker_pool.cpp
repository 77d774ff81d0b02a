#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace txcluster::runtime {

WorkerPool::WorkerPool(std::size_t threads, std::size_t max_pending) {
  if (threads == 0) threads = 1;
  max_pending_ = max_pending == 0 ? threads * 2 : max_pending;
  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  work_cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::Submit(std::function<void()> task) {
  {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [&] { return in_flight_ < max_pending_; });
    tasks_.push(std::move(task));
    ++in_flight_;
  }
  work_cv_.notify_one();
}

void WorkerPool::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return in_flight_ == 0; });

  if (first_error_) {
    auto error   = first_error_;
    first_error_ = nullptr;
    std::rethrow_exception(error);
  }
}

void WorkerPool::Run() {
  for (;;) {
    std::function<void()> task;
    bool                  skip = false;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [&] { return shutdown_ || !tasks_.empty(); });
      if (tasks_.empty()) return;

      task = std::move(tasks_.front());
      tasks_.pop();
      skip = static_cast<bool>(first_error_);
    }

    if (!skip) {
      try {
        task();
      } catch (const std::exception& e) {
        std::lock_guard lock(mutex_);
        if (!first_error_) {
          first_error_ = std::current_exception();
        } else {
          TXCLUSTER_LOG_WARN("worker task failed after an earlier failure", {observability::StringField("error", e.what())});
        }
      }
    }

    {
      std::lock_guard lock(mutex_);
      --in_flight_;
    }
    idle_cv_.notify_all();
  }
}

} // namespace txcluster::runtime
