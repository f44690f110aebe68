#include "live_capture.hpp"

#include "error.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <linux/if_ether.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <poll.h>
#include <scope_guard.hpp>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace whohas::capture {

namespace {

// Large enough for any Ethernet frame without jumbo support
constexpr std::size_t MAX_FRAME_SIZE{2048};

} // namespace

LiveCapture::LiveCapture(std::string interface)
    : interface_(std::move(interface)) {
  if (interface_.empty()) {
    throw ConfigurationError("Capturing requires an interface");
  }

  const unsigned ifindex = if_nametoindex(interface_.c_str());
  if (ifindex == 0) {
    throw ConfigurationError(fmt::format("Unknown interface: {}", interface_));
  }

  int sockfd = socket(AF_PACKET, SOCK_RAW, util::hton(uint16_t{ETH_P_ARP}));
  if (sockfd < 0) {
    throw CaptureError(fmt::format("Failed to open a packet socket on {}: {}",
                                   interface_, std::strerror(errno)));
  }
  auto guard = scope_guard::make_scope_exit([&] { close(sockfd); });

  sockaddr_ll sll{};
  sll.sll_family = AF_PACKET;
  sll.sll_protocol = util::hton(uint16_t{ETH_P_ARP});
  sll.sll_ifindex = static_cast<int>(ifindex);
  if (bind(sockfd, reinterpret_cast<sockaddr *>(&sll), sizeof(sll)) < 0) {
    throw CaptureError(fmt::format("Failed to bind the packet socket to {}: {}",
                                   interface_, std::strerror(errno)));
  }

  guard.dismiss();
  sockfd_ = sockfd;
  LOG_INFO("Capturing ARP traffic on {}", interface_);
}

LiveCapture::~LiveCapture() {
  if (sockfd_ >= 0) {
    close(sockfd_);
  }
}

ReadStatus LiveCapture::read(Frame &frame, std::chrono::milliseconds timeout) {
  pollfd pfd{.fd = sockfd_, .events = POLLIN, .revents = 0};
  int ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ret < 0) {
    if (errno == EINTR) {
      return ReadStatus::Timeout;
    }
    throw CaptureError(fmt::format("Polling {} failed: {}", interface_,
                                   std::strerror(errno)));
  }
  if (ret == 0) {
    return ReadStatus::Timeout;
  }

  frame.data.resize(MAX_FRAME_SIZE);
  ssize_t received = recv(sockfd_, frame.data.data(), frame.data.size(), 0);
  if (received < 0) {
    if (errno == EINTR || errno == EAGAIN) {
      return ReadStatus::Timeout;
    }
    throw CaptureError(fmt::format("Receiving on {} failed: {}", interface_,
                                   std::strerror(errno)));
  }

  frame.data.resize(static_cast<std::size_t>(received));
  frame.original_length = static_cast<uint32_t>(received);
  frame.timestamp = std::chrono::system_clock::now();
  return ReadStatus::Frame;
}

} // namespace whohas::capture
