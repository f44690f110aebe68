#include "address.hpp"

#include <charconv>
#include <ctre.hpp>
#include <fmt/format.h>

namespace whohas::net {

namespace {

constexpr auto IPV4_PAT = ctre::match<
    "([0-9]{1,3})\\.([0-9]{1,3})\\.([0-9]{1,3})\\.([0-9]{1,3})">;

} // namespace

std::optional<uint32_t> parse_ipv4(std::string_view str) {
  auto m = IPV4_PAT(str);
  if (!m) {
    return std::nullopt;
  }

  const std::array<std::string_view, 4> octets{
      m.get<1>().to_view(), m.get<2>().to_view(), m.get<3>().to_view(),
      m.get<4>().to_view()};

  uint32_t address = 0;
  for (auto octet : octets) {
    unsigned value{};
    auto [_, ec] =
        std::from_chars(octet.data(), octet.data() + octet.size(), value);
    if (ec != std::errc() || value > 255) {
      return std::nullopt;
    }
    address = (address << 8) | value;
  }
  return address;
}

std::string ipv4_to_string(uint32_t address) {
  return fmt::format("{}.{}.{}.{}", (address >> 24) & 0xff,
                     (address >> 16) & 0xff, (address >> 8) & 0xff,
                     address & 0xff);
}

std::string mac_to_string(const MacAddress &mac) {
  return fmt::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}", mac[0],
                     mac[1], mac[2], mac[3], mac[4], mac[5]);
}

} // namespace whohas::net
