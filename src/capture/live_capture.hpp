#pragma once

#include "frame.hpp"
#include <chrono>
#include <string>

namespace whohas::capture {

/**
 * @brief Receives the ARP frames seen on a network interface
 *
 * Backed by an AF_PACKET socket bound to the interface and to the ARP
 * EtherType, so other traffic never reaches user space.
 */
class LiveCapture {
public:
  /**
   * @brief Open the capture socket
   *
   * @param interface The interface name, e.g. "eth0"
   *
   * @throws ConfigurationError if the interface is empty or unknown
   * @throws CaptureError if the socket cannot be opened (usually missing
   * CAP_NET_RAW)
   */
  explicit LiveCapture(std::string interface);

  /**
   * @brief Close the capture socket
   */
  ~LiveCapture();

  LiveCapture(const LiveCapture &) = delete;
  LiveCapture &operator=(const LiveCapture &) = delete;

  /**
   * @brief Wait up to timeout for the next frame
   *
   * @return ReadStatus::Frame when a frame was received, ReadStatus::Timeout
   * otherwise; a live source never reaches the end of its input
   *
   * @throws CaptureError if the socket fails
   */
  ReadStatus read(Frame &frame, std::chrono::milliseconds timeout);

private:
  std::string interface_;
  int sockfd_{-1};
};

} // namespace whohas::capture
