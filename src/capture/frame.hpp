#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace whohas::capture {

struct Frame {
  std::vector<std::byte> data{};
  std::chrono::system_clock::time_point timestamp{};
  // Length on the wire; larger than data.size() when the capture was cut
  uint32_t original_length{};
};

enum class ReadStatus { Frame, Timeout, EndOfInput };

// Fills the frame and returns ReadStatus::Frame, or reports that nothing
// arrived within the timeout, or that an offline source is exhausted
using FrameSource = std::function<ReadStatus(Frame &, std::chrono::milliseconds)>;

} // namespace whohas::capture
