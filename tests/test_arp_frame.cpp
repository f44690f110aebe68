#include "helpers.hpp"
#include "net/arp_frame.hpp"
#include "util.hpp"
#include <doctest/doctest.h>
#include <vector>

namespace arp_frame {
using namespace whohas;
using namespace whohas::net;

// Offsets into an Ethernet + ARP frame
constexpr std::size_t ETHER_TYPE = 12;
constexpr std::size_t ARP_HLEN = 18;
constexpr std::size_t ARP_OPCODE = 20;

std::vector<std::byte> request_bytes() {
  return testing::request_frame("10.0.0.1", "10.0.0.2").data;
}

void set_u16(std::vector<std::byte> &frame, std::size_t offset,
             uint16_t value) {
  frame[offset] = static_cast<std::byte>(value >> 8);
  frame[offset + 1] = static_cast<std::byte>(value & 0xff);
}

TEST_CASE("Byte order::round trip") {
  CHECK(util::ntoh(util::hton(uint16_t{0x1234})) == 0x1234);
  CHECK(util::ntoh(util::hton(uint32_t{0x12345678})) == 0x12345678u);
}

TEST_CASE("ARP Frame::built request decodes to its addresses") {
  auto frame = request_bytes();
  REQUIRE(frame.size() == ARP_FRAME_SIZE);

  auto decoded = decode_request(frame);
  REQUIRE(decoded);
  CHECK(decoded.verdict == Verdict::Accepted);
  CHECK((*decoded.event == ArpEvent{"10.0.0.1", "10.0.0.2"}));

  // Broadcast destination
  for (std::size_t i = 0; i < 6; ++i) {
    CHECK(frame[i] == std::byte{0xff});
  }
}

TEST_CASE("ARP Frame::trailing padding is ignored") {
  auto frame = request_bytes();
  frame.resize(60, std::byte{0});
  CHECK(decode_request(frame).verdict == Verdict::Accepted);
}

TEST_CASE("ARP Frame::short frames are truncated") {
  auto frame = request_bytes();
  CHECK(decode_request(std::span(frame).first(10)).verdict ==
        Verdict::Truncated);
  CHECK(decode_request(std::span(frame).first(30)).verdict ==
        Verdict::Truncated);
  CHECK(decode_request({}).verdict == Verdict::Truncated);
}

TEST_CASE("ARP Frame::other ether types are not ARP") {
  auto frame = request_bytes();
  set_u16(frame, ETHER_TYPE, 0x0800);
  auto decoded = decode_request(frame);
  CHECK(decoded.verdict == Verdict::NotArp);
  CHECK_FALSE(decoded);
  CHECK_FALSE(decoded.event.has_value());
}

TEST_CASE("ARP Frame::only IPv4 over Ethernet is supported") {
  auto frame = request_bytes();
  frame[ARP_HLEN] = std::byte{8};
  CHECK(decode_request(frame).verdict == Verdict::UnsupportedAddresses);
}

TEST_CASE("ARP Frame::replies are not requests") {
  auto frame = request_bytes();
  set_u16(frame, ARP_OPCODE, 2);
  CHECK(decode_request(frame).verdict == Verdict::NotRequest);

  auto reply = decode_reply(frame);
  REQUIRE(reply);
  CHECK(reply->sender_ip == *parse_ipv4("10.0.0.1"));
  CHECK(reply->sender_mac == testing::TEST_MAC);

  // And a request is not a reply
  CHECK_FALSE(decode_reply(request_bytes()).has_value());
}

TEST_CASE("ARP Frame::verdicts describe themselves") {
  CHECK(std::string_view(to_str(Verdict::Accepted)) == "Accepted");
  CHECK(std::string_view(to_str(Verdict::NotRequest)) == "Not an ARP request");
}

} // namespace arp_frame
