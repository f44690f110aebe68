#pragma once

#include "result.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace whohas::enrich {

// Reverse-name lookup for one address; returns the resolved name
using ReverseLookup = std::function<Result<std::string>(std::string_view)>;

/**
 * @brief Resolve the PTR name of an IPv4 address through the system resolver
 *
 * Any failure, including an address without a PTR record, is reported as a
 * missing value. The lookup is bounded by the resolver's own timeout and
 * attempt settings (resolv.conf).
 *
 * @param address A dotted-quad IPv4 address
 */
Result<std::string> dns_reverse_lookup(std::string_view address);

} // namespace whohas::enrich
