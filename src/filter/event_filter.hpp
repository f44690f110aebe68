#pragma once

#include "address_list.hpp"
#include "net/arp_frame.hpp"
#include <optional>
#include <string_view>

namespace whohas::filter {

/**
 * @brief Accepts or rejects (sender, target) pairs
 *
 * Each role has its own optional policy; an unset policy accepts everything.
 * An event passes only when both roles pass.
 */
class EventFilter {
public:
  EventFilter() = default;
  EventFilter(std::optional<AddressPolicy> senders,
              std::optional<AddressPolicy> targets);

  [[nodiscard]] bool accepts(const net::ArpEvent &event) const {
    return accepts_sender(event.sender) && accepts_target(event.target);
  }

  [[nodiscard]] bool accepts_sender(std::string_view address) const {
    return !senders_ || senders_->check(address);
  }

  [[nodiscard]] bool accepts_target(std::string_view address) const {
    return !targets_ || targets_->check(address);
  }

  // True when no policy narrows anything
  bool accepts_all() const { return !senders_ && !targets_; }

private:
  std::optional<AddressPolicy> senders_{};
  std::optional<AddressPolicy> targets_{};
};

} // namespace whohas::filter
