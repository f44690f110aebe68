#include "worker_pool.hpp"

#include "logger.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

namespace whohas::enrich {

WorkerPool::WorkerPool(std::size_t workers, std::size_t capacity)
    : capacity_(capacity) {
  if (workers == 0) {
    throw std::invalid_argument("Worker pool needs at least one worker");
  }
  if (capacity == 0) {
    throw std::invalid_argument("Worker pool queue capacity must be positive");
  }

  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&WorkerPool::worker_loop, this);
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();

  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void WorkerPool::submit(Task task) {
  std::unique_lock lock(mutex_);
  not_full_.wait(lock,
                 [this] { return stopping_ || queue_.size() < capacity_; });
  if (stopping_) {
    throw std::logic_error("Task submitted to a stopping worker pool");
  }
  queue_.push_back(std::move(task));
  not_empty_.notify_one();
}

void WorkerPool::wait_idle() {
  std::unique_lock lock(mutex_);
  idle_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

std::size_t WorkerPool::failures() const {
  std::lock_guard lock(mutex_);
  return failures_;
}

void WorkerPool::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock lock(mutex_);
      not_empty_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      // Queued tasks are still drained after a stop request
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      ++running_;
    }
    not_full_.notify_one();

    bool failed = false;
    try {
      task();
    } catch (const std::exception &e) {
      LOG_ERROR("Enrichment task failed: {}", e.what());
      failed = true;
    }

    {
      std::lock_guard lock(mutex_);
      --running_;
      if (failed) {
        ++failures_;
      }
      if (queue_.empty() && running_ == 0) {
        idle_.notify_all();
      }
    }
  }
}

} // namespace whohas::enrich
