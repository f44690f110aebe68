#pragma once

#include "ledger.hpp"
#include <cstddef>
#include <cstdint>

namespace whohas::ledger {

struct MergeSummary {
  std::size_t transactions{};
  std::size_t created_entities{};
  uint64_t requests{};
};

/**
 * @brief Fold the transactions of source into destination
 *
 * Entities are matched by address value. A destination entity created by the
 * merge takes over the source's canonical reverse name as is; nothing is
 * resolved again. Counts are summed, so merging the same source twice counts
 * its requests twice.
 *
 * @param destination The ledger receiving the transactions
 * @param source The ledger to read from, left untouched
 * @return What the merge added to destination
 */
MergeSummary merge(Ledger &destination, const Ledger &source);

} // namespace whohas::ledger
