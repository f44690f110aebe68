#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace whohas::filter {

/**
 * @brief A set of IPv4 addresses and CIDR networks
 */
class AddressList {
public:
  /**
   * @brief Build a list from textual entries
   *
   * Each entry is a dotted-quad address ("10.0.0.1") or a CIDR network
   * ("10.0.0.0/8"). Surrounding whitespace is ignored.
   *
   * @throws std::invalid_argument if an entry is neither
   */
  [[nodiscard]] static AddressList
  from_entries(const std::vector<std::string> &entries);

  /**
   * @brief Read a list from a file, one entry per line
   *
   * Blank lines and everything after a '#' are ignored.
   *
   * @throws FileNotFound if the file does not exist
   * @throws std::invalid_argument if a line holds an invalid entry
   */
  [[nodiscard]] static AddressList from_file(const std::filesystem::path &path);

  void add(std::string_view entry);

  void merge(const AddressList &other);

  /**
   * @brief Check whether an address belongs to one of the networks
   *
   * @param address A dotted-quad address; anything else never matches
   */
  [[nodiscard]] bool contains(std::string_view address) const;

  bool empty() const { return networks_.empty(); }

  std::size_t size() const { return networks_.size(); }

private:
  struct Network {
    uint32_t prefix;
    uint32_t mask;
  };

  std::vector<Network> networks_{};
};

/**
 * @brief Allow/deny policy for one role (sender or target)
 *
 * An address passes when it is not denied and, if an allow list is set, it is
 * allowed.
 */
struct AddressPolicy {
  [[nodiscard]] bool check(std::string_view address) const {
    if (deny.contains(address)) {
      return false;
    }
    return allow.empty() || allow.contains(address);
  }

  bool empty() const { return allow.empty() && deny.empty(); }

  AddressList allow{};
  AddressList deny{};
};

} // namespace whohas::filter
