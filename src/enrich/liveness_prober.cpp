#include "liveness_prober.hpp"

#include "error.hpp"
#include "logger.hpp"
#include "net/arp_frame.hpp"
#include "util.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <linux/if_ether.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <scope_guard.hpp>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace whohas::enrich {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t RECV_BUFFER_SIZE{2048};

ifreq make_ifreq(const std::string &interface) {
  ifreq ifr{};
  std::strncpy(ifr.ifr_name, interface.c_str(), IFNAMSIZ - 1);
  return ifr;
}

} // namespace

ArpProber::ArpProber(ProbeOptions options) : options_(std::move(options)) {
  if (options_.interface.empty()) {
    throw ConfigurationError("Liveness probing requires a capture interface");
  }
  if (options_.interface.size() >= IFNAMSIZ) {
    throw ConfigurationError(
        fmt::format("Interface name too long: {}", options_.interface));
  }
  if (options_.timeout.count() <= 0) {
    throw ConfigurationError("Liveness probe timeout must be positive");
  }

  int sockfd = socket(AF_INET, SOCK_DGRAM, 0);
  if (sockfd < 0) {
    throw ConfigurationError(fmt::format(
        "Failed to query interface {}: {}", options_.interface,
        std::strerror(errno)));
  }
  auto guard = scope_guard::make_scope_exit([&] { close(sockfd); });

  auto ifr = make_ifreq(options_.interface);
  if (ioctl(sockfd, SIOCGIFINDEX, &ifr) < 0) {
    throw ConfigurationError(
        fmt::format("Unknown interface: {}", options_.interface));
  }
  ifindex_ = ifr.ifr_ifindex;

  ifr = make_ifreq(options_.interface);
  if (ioctl(sockfd, SIOCGIFHWADDR, &ifr) < 0) {
    throw ConfigurationError(fmt::format(
        "Failed to read the MAC address of {}", options_.interface));
  }
  std::copy_n(reinterpret_cast<const uint8_t *>(ifr.ifr_hwaddr.sa_data),
              mac_.size(), mac_.begin());

  ifr = make_ifreq(options_.interface);
  ifr.ifr_addr.sa_family = AF_INET;
  if (ioctl(sockfd, SIOCGIFADDR, &ifr) < 0) {
    throw ConfigurationError(
        fmt::format("Interface {} has no IPv4 address", options_.interface));
  }
  sockaddr_in addr{};
  std::memcpy(&addr, &ifr.ifr_addr, sizeof(addr));
  ip_ = util::ntoh(static_cast<uint32_t>(addr.sin_addr.s_addr));

  LOG_INFO("Liveness probes go out on {} ({}, {})", options_.interface,
           net::ipv4_to_string(ip_), net::mac_to_string(mac_));
}

Result<net::MacAddress> ArpProber::probe(std::string_view target) const {
  auto target_ip = net::parse_ipv4(target);
  if (!target_ip) {
    return Result<net::MacAddress>::failure(Status::Unknown);
  }

  int sockfd = socket(AF_PACKET, SOCK_RAW, util::hton(uint16_t{ETH_P_ARP}));
  if (sockfd < 0) {
    LOG_WARN("Failed to open a packet socket for probing {}: {}", target,
             std::strerror(errno));
    return Result<net::MacAddress>::failure(Status::Socket);
  }
  auto guard = scope_guard::make_scope_exit([&] { close(sockfd); });

  sockaddr_ll sll{};
  sll.sll_family = AF_PACKET;
  sll.sll_protocol = util::hton(uint16_t{ETH_P_ARP});
  sll.sll_ifindex = ifindex_;
  if (bind(sockfd, reinterpret_cast<sockaddr *>(&sll), sizeof(sll)) < 0) {
    LOG_WARN("Failed to bind the probe socket to {}: {}", options_.interface,
             std::strerror(errno));
    return Result<net::MacAddress>::failure(Status::Socket);
  }

  const auto request = net::build_request(mac_, ip_, *target_ip);
  sll.sll_halen = ETH_ALEN;
  std::fill(std::begin(sll.sll_addr), std::begin(sll.sll_addr) + ETH_ALEN,
            0xff);

  std::array<std::byte, RECV_BUFFER_SIZE> buffer{};

  for (unsigned attempt = 0; attempt <= options_.retry; ++attempt) {
    if (sendto(sockfd, request.data(), request.size(), 0,
               reinterpret_cast<const sockaddr *>(&sll), sizeof(sll)) < 0) {
      LOG_WARN("Failed to send probe for {}: {}", target, std::strerror(errno));
      return Result<net::MacAddress>::failure(Status::Socket);
    }

    const auto deadline = Clock::now() + options_.timeout;
    while (true) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - Clock::now());
      if (remaining.count() <= 0) {
        break;
      }

      pollfd pfd{.fd = sockfd, .events = POLLIN, .revents = 0};
      int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
      if (ret < 0) {
        if (errno == EINTR) {
          continue;
        }
        return Result<net::MacAddress>::failure(Status::Socket);
      }
      if (ret == 0) {
        break;
      }

      ssize_t received = recv(sockfd, buffer.data(), buffer.size(), 0);
      if (received < 0) {
        if (errno == EINTR || errno == EAGAIN) {
          continue;
        }
        return Result<net::MacAddress>::failure(Status::Socket);
      }

      auto reply = net::decode_reply(
          std::span<const std::byte>(buffer.data(), received));
      if (reply && reply->sender_ip == *target_ip) {
        LOG_DEBUG("{} answered from {}", target,
                  net::mac_to_string(reply->sender_mac));
        return Result<net::MacAddress>::success(reply->sender_mac);
      }
    }

    LOG_DEBUG("Probe {}/{} for {} went unanswered", attempt + 1,
              options_.retry + 1, target);
  }

  return Result<net::MacAddress>::failure(Status::Timeout);
}

} // namespace whohas::enrich
