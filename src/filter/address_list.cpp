#include "address_list.hpp"

#include "error.hpp"
#include "net/address.hpp"
#include "util.hpp"
#include <algorithm>
#include <charconv>
#include <ctre.hpp>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

namespace whohas::filter {

namespace {

constexpr auto ENTRY_PAT =
    ctre::match<"\\s*([0-9.]+)(?:/([0-9]{1,2}))?\\s*">;

std::string_view strip_comment(std::string_view line) {
  auto pos = line.find('#');
  if (pos != std::string_view::npos) {
    line = line.substr(0, pos);
  }
  auto first = line.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = line.find_last_not_of(" \t\r");
  return line.substr(first, last - first + 1);
}

} // namespace

AddressList AddressList::from_entries(const std::vector<std::string> &entries) {
  AddressList list{};
  for (const auto &entry : entries) {
    list.add(entry);
  }
  return list;
}

AddressList AddressList::from_file(const std::filesystem::path &path) {
  if (!std::filesystem::is_regular_file(path)) {
    throw FileNotFound(path.string());
  }

  std::ifstream input(path);
  if (!input) {
    throw std::runtime_error(
        fmt::format("Failed to open address list {}", path.string()));
  }

  AddressList list{};
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    auto entry = strip_comment(line);
    if (entry.empty()) {
      continue;
    }
    try {
      list.add(entry);
    } catch (const std::invalid_argument &e) {
      throw std::invalid_argument(fmt::format("{}:{}: {}", path.string(),
                                              line_number, e.what()));
    }
  }
  return list;
}

void AddressList::add(std::string_view entry) {
  auto m = ENTRY_PAT(entry);
  if (!m) {
    throw std::invalid_argument(
        fmt::format("Invalid address list entry: {}", entry));
  }

  auto address = net::parse_ipv4(m.get<1>().to_view());
  if (!address) {
    throw std::invalid_argument(
        fmt::format("Invalid address list entry: {}", entry));
  }

  unsigned prefix_len = 32;
  if (auto prefix = m.get<2>().to_view(); !prefix.empty()) {
    auto [_, ec] = std::from_chars(prefix.data(), prefix.data() + prefix.size(),
                                   prefix_len);
    if (ec != std::errc() || prefix_len > 32) {
      throw std::invalid_argument(
          fmt::format("Invalid network prefix length: {}", entry));
    }
  }

  const auto mask = util::prefix_mask<uint32_t>(prefix_len);
  networks_.push_back({*address & mask, mask});
}

void AddressList::merge(const AddressList &other) {
  networks_.insert(networks_.end(), other.networks_.begin(),
                   other.networks_.end());
}

bool AddressList::contains(std::string_view address) const {
  auto ip = net::parse_ipv4(address);
  if (!ip) {
    return false;
  }
  return std::any_of(networks_.begin(), networks_.end(),
                     [&](const Network &network) {
                       return (*ip & network.mask) == network.prefix;
                     });
}

} // namespace whohas::filter
