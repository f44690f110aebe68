#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace whohas::enrich {

/**
 * @brief A fixed set of threads draining a bounded task queue
 *
 * Used for the blocking enrichment lookups so that a slow reverse lookup or
 * an unanswered probe never stalls the ingestion of unrelated events.
 */
class WorkerPool {
public:
  using Task = std::function<void()>;

  /**
   * @brief Start the worker threads
   *
   * @param workers The number of threads (at least 1)
   * @param capacity The maximum number of queued tasks (at least 1)
   *
   * @throws std::invalid_argument if workers or capacity is 0
   */
  WorkerPool(std::size_t workers, std::size_t capacity);

  /**
   * @brief Finish the queued tasks and join the threads
   */
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Queue a task, blocking while the queue is full
   *
   * A task that throws is logged and counted; it does not stop its worker.
   */
  void submit(Task task);

  /**
   * @brief Block until the queue is empty and no task is running
   */
  void wait_idle();

  std::size_t failures() const;

  std::size_t size() const { return threads_.size(); }

private:
  void worker_loop();

  std::size_t capacity_;
  std::deque<Task> queue_{};
  std::size_t running_{0};
  std::size_t failures_{0};
  bool stopping_{false};

  mutable std::mutex mutex_{};
  std::condition_variable not_empty_{};
  std::condition_variable not_full_{};
  std::condition_variable idle_{};

  std::vector<std::thread> threads_{};
};

} // namespace whohas::enrich
