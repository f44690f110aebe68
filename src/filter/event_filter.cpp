#include "event_filter.hpp"

#include <utility>

namespace whohas::filter {

namespace {

// An all-empty policy accepts everything; treat it as not configured
std::optional<AddressPolicy> normalize(std::optional<AddressPolicy> policy) {
  if (policy && policy->empty()) {
    return std::nullopt;
  }
  return policy;
}

} // namespace

EventFilter::EventFilter(std::optional<AddressPolicy> senders,
                         std::optional<AddressPolicy> targets)
    : senders_(normalize(std::move(senders))),
      targets_(normalize(std::move(targets))) {}

} // namespace whohas::filter
