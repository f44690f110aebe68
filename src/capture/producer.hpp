#pragma once

#include "channel.hpp"
#include "filter/event_filter.hpp"
#include "frame.hpp"
#include "net/arp_frame.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <stop_token>
#include <thread>
#include <vector>

namespace whohas::capture {

using Batch = std::vector<net::ArpEvent>;
using BatchChannel = Channel<Batch>;

// Receives every frame that made it into a batch
using FrameSink = std::function<void(const Frame &)>;

struct ProducerOptions {
  // Accepted requests per batch
  std::size_t batch_size{5};
  // How long a single read may block before the stop request is checked
  std::chrono::milliseconds poll_interval{250};
};

struct ProducerStats {
  std::atomic<std::size_t> frames{0};
  std::atomic<std::size_t> invalid{0};
  std::atomic<std::size_t> filtered{0};
  std::atomic<std::size_t> accepted{0};
  std::atomic<std::size_t> batches{0};
};

/**
 * @brief Turns a frame source into batches of accepted ARP requests
 *
 * Frames are decoded, checked against the filter and grouped by batch_size
 * into the channel. The channel is closed when the producer finishes: at the
 * end of an offline source (after sending the last partial batch), on a stop
 * request, or when the source fails.
 */
class CaptureProducer {
public:
  /**
   * @throws std::invalid_argument if options.batch_size is 0
   */
  CaptureProducer(FrameSource source, filter::EventFilter filter,
                  BatchChannel &channel, ProducerOptions options = {},
                  FrameSink sink = {});

  /**
   * @brief Request a stop and join the producer thread
   */
  ~CaptureProducer();

  CaptureProducer(const CaptureProducer &) = delete;
  CaptureProducer &operator=(const CaptureProducer &) = delete;

  /**
   * @brief Run the producer on its own thread
   */
  void start();

  /**
   * @brief Ask the producer to stop after the current read and wait for it
   *
   * Events of a partial batch are dropped. Safe to call more than once.
   */
  void stop();

  /**
   * @brief Produce on the calling thread until the source ends or a stop is
   * requested
   */
  void run(std::stop_token stop_token = {});

  /**
   * @brief Rethrow the error that ended the producer, if any
   */
  void rethrow_if_failed() const;

  const ProducerStats &stats() const { return stats_; }

private:
  void produce(std::stop_token stop_token);

  FrameSource source_;
  filter::EventFilter filter_;
  BatchChannel &channel_;
  ProducerOptions options_;
  FrameSink sink_;

  ProducerStats stats_{};
  std::exception_ptr error_{};
  std::jthread thread_{};
};

} // namespace whohas::capture
