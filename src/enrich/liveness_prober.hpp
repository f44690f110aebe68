#pragma once

#include "net/address.hpp"
#include "result.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace whohas::enrich {

// Active liveness check for one address; returns the MAC that answered
using LivenessProbe = std::function<Result<net::MacAddress>(std::string_view)>;

struct ProbeOptions {
  std::string interface;
  // Extra requests sent after the first one went unanswered
  unsigned retry{0};
  // How long each request waits for an answer
  std::chrono::milliseconds timeout{1000};
};

/**
 * @brief Sends ARP who-has requests on an interface and waits for the answer
 */
class ArpProber {
public:
  /**
   * @brief Look up the interface the probes are sent from
   *
   * @param options The interface and the retry/timeout budget
   *
   * @throws ConfigurationError if no interface is given, the interface does
   * not exist or has no IPv4 address, or the timeout is not positive
   */
  explicit ArpProber(ProbeOptions options);

  /**
   * @brief Probe an address
   *
   * Sends up to retry + 1 requests, each one waiting for at most timeout.
   * Never blocks longer than (retry + 1) * timeout.
   *
   * @param target A dotted-quad IPv4 address
   * @return The MAC address of the host that answered, or Timeout when no
   * answer arrived, or Socket when the raw socket could not be used
   */
  Result<net::MacAddress> probe(std::string_view target) const;

  Result<net::MacAddress> operator()(std::string_view target) const {
    return probe(target);
  }

private:
  ProbeOptions options_;
  int ifindex_{};
  net::MacAddress mac_{};
  uint32_t ip_{};
};

} // namespace whohas::enrich
