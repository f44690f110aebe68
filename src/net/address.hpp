#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace whohas::net {

using MacAddress = std::array<uint8_t, 6>;

/**
 * @brief Parse a dotted-quad IPv4 address
 *
 * @param str The address, e.g. "192.168.1.10"
 * @return The address in host byte order, or std::nullopt if str is not a
 * valid dotted-quad address
 */
std::optional<uint32_t> parse_ipv4(std::string_view str);

/**
 * @brief Format an IPv4 address held in host byte order
 */
std::string ipv4_to_string(uint32_t address);

/**
 * @brief Format a MAC address as six colon-separated lowercase hex octets
 */
std::string mac_to_string(const MacAddress &mac);

} // namespace whohas::net
