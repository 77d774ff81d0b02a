#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace txcluster::runtime {

/*
  Fixed-size pool of worker threads.

  Tasks are submitted between barriers; WaitIdle() blocks until every
  submitted task has finished, then rethrows the first exception a task
  raised (later ones are logged and dropped). After a failure, tasks still
  queued are skipped.

  Submit() blocks while max_pending tasks are queued or running, so a
  producer paging through storage never runs far ahead of the workers.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads, std::size_t max_pending = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Submit(std::function<void()> task);

  // barrier
  void WaitIdle();

  std::size_t Size() const {
    return threads_.size();
  }

 private:
  void Run();

  std::mutex                        mutex_;
  std::condition_variable           work_cv_;
  std::condition_variable           idle_cv_;
  std::size_t                       max_pending_;
  std::queue<std::function<void()>> tasks_;
  std::size_t                       in_flight_ = 0;
  std::exception_ptr                first_error_;
  bool                              shutdown_ = false;

  std::vector<std::thread> threads_;
};

} // namespace txcluster::runtime
