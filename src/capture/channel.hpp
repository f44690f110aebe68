#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace whohas::capture {

/**
 * @brief A bounded single-producer single-consumer queue
 *
 * send() blocks while the channel is full. Once closed, send() drops its item
 * and receivers drain what is left, then get std::nullopt.
 */
template <typename T> class Channel {
public:
  explicit Channel(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("Channel capacity must be positive");
    }
  }

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  /**
   * @brief Enqueue an item, blocking while the channel is full
   *
   * @return false if the channel was closed and the item dropped
   */
  bool send(T item) {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    queue_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  /**
   * @brief Dequeue an item, blocking until one is available
   *
   * @return The front item, or std::nullopt once the channel is closed and
   * empty
   */
  std::optional<T> receive() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    return pop_front();
  }

  /**
   * @brief Dequeue an item, waiting at most timeout
   *
   * @return The front item, or std::nullopt on timeout or once the channel is
   * closed and empty
   */
  std::optional<T> receive_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    not_empty_.wait_for(lock, timeout,
                        [this] { return closed_ || !queue_.empty(); });
    return pop_front();
  }

  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Closed and fully drained: nothing will ever come out again
  bool finished() const {
    std::lock_guard lock(mutex_);
    return closed_ && queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

private:
  // The caller holds mutex_
  std::optional<T> pop_front() {
    if (queue_.empty()) {
      return std::nullopt;
    }
    T item = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return item;
  }

  std::size_t capacity_;
  std::deque<T> queue_{};
  bool closed_{false};

  mutable std::mutex mutex_{};
  std::condition_variable not_empty_{};
  std::condition_variable not_full_{};
};

} // namespace whohas::capture
