#pragma once

#include "color_profile.hpp"
#include "filter/event_filter.hpp"
#include "ledger/ledger.hpp"
#include "ledger/transaction_ledger.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace whohas::report {

inline constexpr std::string_view NO_RECORDS_MESSAGE{
    "- No accepted ARP requests captured\n"
    "- If this is unexpected, check your whitelist/blacklist configuration\n"};

struct ReportOptions {
  // Add the liveness flag column
  bool liveness{false};
  // Add the sender and target reverse-name columns
  bool reverse_names{false};
  // nullptr renders plain text
  const ColorProfile *profile{nullptr};
  // Narrows the rendered rows without touching the ledger
  std::optional<filter::EventFilter> filter{};
};

// All transactions of one sender, in descending count order
struct SenderGroup {
  std::string sender;
  std::vector<ledger::TransactionRow> rows;
};

/**
 * @brief Group transaction rows by sender
 *
 * @param rows Rows in descending count order
 * @param filter Rows it rejects are left out
 *
 * @return Groups in order of each sender's first appearance
 */
std::vector<SenderGroup>
group_by_sender(const std::vector<ledger::TransactionRow> &rows,
                const std::optional<filter::EventFilter> &filter = std::nullopt);

/**
 * @brief Render the ledger as a table
 *
 * @return The table, or NO_RECORDS_MESSAGE when there is nothing to show
 *
 * @throws StorageError if the ledger cannot be read
 */
std::string build_report(const ledger::Ledger &ledger,
                         const ReportOptions &options);

} // namespace whohas::report
