#include "arp_frame.hpp"

#include "util.hpp"
#include <algorithm>
#include <cstring>
#include <net/ethernet.h>
#include <net/if_arp.h>
#include <netinet/if_ether.h>

namespace whohas::net {

namespace {

static_assert(sizeof(ether_header) + sizeof(ether_arp) == ARP_FRAME_SIZE);

struct FrameView {
  std::span<const std::byte> frame;
  ether_header eth{};
  ether_arp arp{};
};

using Stage = Verdict (*)(FrameView &);

Verdict read_ethernet(FrameView &view) {
  if (view.frame.size() < sizeof(ether_header)) {
    return Verdict::Truncated;
  }
  std::memcpy(&view.eth, view.frame.data(), sizeof(ether_header));
  if (util::ntoh(view.eth.ether_type) != ETHERTYPE_ARP) {
    return Verdict::NotArp;
  }
  return Verdict::Accepted;
}

Verdict read_arp(FrameView &view) {
  if (view.frame.size() < ARP_FRAME_SIZE) {
    return Verdict::Truncated;
  }
  std::memcpy(&view.arp, view.frame.data() + sizeof(ether_header),
              sizeof(ether_arp));
  return Verdict::Accepted;
}

Verdict check_ipv4_over_ethernet(FrameView &view) {
  const auto &hdr = view.arp.ea_hdr;
  if (util::ntoh(hdr.ar_hrd) != ARPHRD_ETHER ||
      util::ntoh(hdr.ar_pro) != ETHERTYPE_IP || hdr.ar_hln != ETH_ALEN ||
      hdr.ar_pln != 4) {
    return Verdict::UnsupportedAddresses;
  }
  return Verdict::Accepted;
}

Verdict check_request(FrameView &view) {
  return util::ntoh(view.arp.ea_hdr.ar_op) == ARPOP_REQUEST
             ? Verdict::Accepted
             : Verdict::NotRequest;
}

Verdict check_reply(FrameView &view) {
  return util::ntoh(view.arp.ea_hdr.ar_op) == ARPOP_REPLY ? Verdict::Accepted
                                                          : Verdict::NotReply;
}

constexpr std::array<Stage, 4> REQUEST_STAGES{
    read_ethernet, read_arp, check_ipv4_over_ethernet, check_request};
constexpr std::array<Stage, 4> REPLY_STAGES{read_ethernet, read_arp,
                                            check_ipv4_over_ethernet,
                                            check_reply};

Verdict run_stages(std::span<const Stage> stages, FrameView &view) {
  for (auto stage : stages) {
    if (auto verdict = stage(view); verdict != Verdict::Accepted) {
      return verdict;
    }
  }
  return Verdict::Accepted;
}

uint32_t read_ipv4(const uint8_t (&bytes)[4]) {
  uint32_t address{};
  std::memcpy(&address, bytes, sizeof(address));
  return util::ntoh(address);
}

void write_ipv4(uint8_t (&bytes)[4], uint32_t address) {
  address = util::hton(address);
  std::memcpy(bytes, &address, sizeof(address));
}

} // namespace

DecodedRequest decode_request(std::span<const std::byte> frame) {
  FrameView view{.frame = frame};
  auto verdict = run_stages(REQUEST_STAGES, view);
  if (verdict != Verdict::Accepted) {
    return {verdict, std::nullopt};
  }

  return {Verdict::Accepted,
          ArpEvent{.sender = ipv4_to_string(read_ipv4(view.arp.arp_spa)),
                   .target = ipv4_to_string(read_ipv4(view.arp.arp_tpa))}};
}

std::optional<ArpReply> decode_reply(std::span<const std::byte> frame) {
  FrameView view{.frame = frame};
  if (run_stages(REPLY_STAGES, view) != Verdict::Accepted) {
    return std::nullopt;
  }

  ArpReply reply{.sender_ip = read_ipv4(view.arp.arp_spa)};
  std::copy(std::begin(view.arp.arp_sha), std::end(view.arp.arp_sha),
            reply.sender_mac.begin());
  return reply;
}

ArpFrame build_request(const MacAddress &source_mac, uint32_t source_ip,
                       uint32_t target_ip) {
  ether_header eth{};
  std::fill(std::begin(eth.ether_dhost), std::end(eth.ether_dhost), 0xff);
  std::copy(source_mac.begin(), source_mac.end(), std::begin(eth.ether_shost));
  eth.ether_type = util::hton(static_cast<uint16_t>(ETHERTYPE_ARP));

  ether_arp arp{};
  arp.ea_hdr.ar_hrd = util::hton(static_cast<uint16_t>(ARPHRD_ETHER));
  arp.ea_hdr.ar_pro = util::hton(static_cast<uint16_t>(ETHERTYPE_IP));
  arp.ea_hdr.ar_hln = ETH_ALEN;
  arp.ea_hdr.ar_pln = 4;
  arp.ea_hdr.ar_op = util::hton(static_cast<uint16_t>(ARPOP_REQUEST));
  std::copy(source_mac.begin(), source_mac.end(), std::begin(arp.arp_sha));
  write_ipv4(arp.arp_spa, source_ip);
  // The target hardware address stays zeroed: that is what is being asked
  write_ipv4(arp.arp_tpa, target_ip);

  ArpFrame frame{};
  std::memcpy(frame.data(), &eth, sizeof(eth));
  std::memcpy(frame.data() + sizeof(eth), &arp, sizeof(arp));
  return frame;
}

} // namespace whohas::net
