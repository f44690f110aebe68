#include "producer.hpp"

#include "logger.hpp"
#include <stdexcept>
#include <utility>

namespace whohas::capture {

CaptureProducer::CaptureProducer(FrameSource source, filter::EventFilter filter,
                                 BatchChannel &channel, ProducerOptions options,
                                 FrameSink sink)
    : source_(std::move(source)), filter_(std::move(filter)),
      channel_(channel), options_(options), sink_(std::move(sink)) {
  if (options_.batch_size == 0) {
    throw std::invalid_argument("Batch size must be positive");
  }
  if (!source_) {
    throw std::invalid_argument("Capture producer needs a frame source");
  }
}

CaptureProducer::~CaptureProducer() { stop(); }

void CaptureProducer::start() {
  if (thread_.joinable()) {
    throw std::logic_error("Capture producer already started");
  }
  thread_ = std::jthread([this](std::stop_token stop_token) {
    run(std::move(stop_token));
  });
}

void CaptureProducer::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void CaptureProducer::run(std::stop_token stop_token) {
  try {
    produce(std::move(stop_token));
  } catch (const std::exception &e) {
    LOG_ERROR("Capture stopped: {}", e.what());
    error_ = std::current_exception();
  }
  channel_.close();

  LOG_INFO("Capture finished: {} frames, {} accepted, {} filtered, {} invalid",
           stats_.frames.load(), stats_.accepted.load(),
           stats_.filtered.load(), stats_.invalid.load());
}

void CaptureProducer::rethrow_if_failed() const {
  if (error_) {
    std::rethrow_exception(error_);
  }
}

void CaptureProducer::produce(std::stop_token stop_token) {
  Batch batch{};
  batch.reserve(options_.batch_size);
  Frame frame{};

  while (!stop_token.stop_requested()) {
    auto status = source_(frame, options_.poll_interval);
    if (status == ReadStatus::Timeout) {
      continue;
    }
    if (status == ReadStatus::EndOfInput) {
      if (!batch.empty()) {
        ++stats_.batches;
        channel_.send(std::move(batch));
      }
      return;
    }

    ++stats_.frames;
    auto decoded = net::decode_request(frame.data);
    if (!decoded) {
      ++stats_.invalid;
      LOG_TRACE("Frame skipped: {}", net::to_str(decoded.verdict));
      continue;
    }
    if (!filter_.accepts(*decoded.event)) {
      ++stats_.filtered;
      continue;
    }

    ++stats_.accepted;
    if (sink_) {
      sink_(frame);
    }
    batch.push_back(std::move(*decoded.event));

    if (batch.size() >= options_.batch_size) {
      ++stats_.batches;
      if (!channel_.send(std::move(batch))) {
        // The consumer closed the channel: nobody is listening anymore
        return;
      }
      batch = Batch{};
      batch.reserve(options_.batch_size);
    }
  }
}

} // namespace whohas::capture
