#pragma once

#include "address.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace whohas::net {

// One "who-has" request: sender asked who owns target
struct ArpEvent {
  std::string sender;
  std::string target;

  friend bool operator==(const ArpEvent &, const ArpEvent &) = default;
};

enum class Verdict {
  Accepted = 0,
  Truncated,
  NotArp,
  UnsupportedAddresses,
  NotRequest,
  NotReply
};

constexpr auto to_str(Verdict verdict) {
  switch (verdict) {
  case Verdict::Accepted:
    return "Accepted";
  case Verdict::Truncated:
    return "Frame too short";
  case Verdict::NotArp:
    return "Not an ARP frame";
  case Verdict::UnsupportedAddresses:
    return "Not IPv4 over Ethernet";
  case Verdict::NotRequest:
    return "Not an ARP request";
  case Verdict::NotReply:
    return "Not an ARP reply";
  default:
    return "Invalid verdict";
  }
}

struct DecodedRequest {
  explicit operator bool() const { return verdict == Verdict::Accepted; }

  Verdict verdict{Verdict::Truncated};
  std::optional<ArpEvent> event{};
};

struct ArpReply {
  uint32_t sender_ip{};
  MacAddress sender_mac{};
};

// Ethernet header followed by an IPv4-over-Ethernet ARP packet
inline constexpr std::size_t ARP_FRAME_SIZE = 14 + 28;

using ArpFrame = std::array<std::byte, ARP_FRAME_SIZE>;

/**
 * @brief Decode a captured frame as an ARP who-has request
 *
 * The frame goes through a fixed chain of validation stages (Ethernet header,
 * ARP header, IPv4-over-Ethernet address sizes, request opcode). The first
 * stage that rejects it decides the verdict.
 *
 * @param frame The raw Ethernet frame
 * @return The verdict, and the event when the frame was accepted
 */
DecodedRequest decode_request(std::span<const std::byte> frame);

/**
 * @brief Decode a captured frame as an ARP reply
 *
 * @param frame The raw Ethernet frame
 * @return The sender of the reply, or std::nullopt for any other frame
 */
std::optional<ArpReply> decode_reply(std::span<const std::byte> frame);

/**
 * @brief Build a broadcast who-has request for target_ip
 *
 * @param source_mac The MAC address of the sending interface
 * @param source_ip The IPv4 address of the sending interface (host order)
 * @param target_ip The address being asked for (host order)
 */
ArpFrame build_request(const MacAddress &source_mac, uint32_t source_ip,
                       uint32_t target_ip);

} // namespace whohas::net
