#include "report_builder.hpp"

#include "table.hpp"
#include <string>
#include <unordered_map>
#include <utility>

namespace whohas::report {

namespace {

std::vector<Column> make_columns(const ReportOptions &options) {
  std::vector<Column> columns{{"Sender"}, {"Target"}};
  if (options.liveness) {
    columns.push_back({"TS"});
  }
  columns.push_back({"ARP#", Align::Right});
  if (options.reverse_names) {
    columns.push_back({"Sender PTR"});
    columns.push_back({"Target PTR"});
  }
  return columns;
}

std::string stale_marker(const ReportOptions &options) {
  if (options.profile && options.profile->stale_marker) {
    return *options.profile->stale_marker;
  }
  return std::string{DEFAULT_STALE_MARKER};
}

} // namespace

std::vector<SenderGroup>
group_by_sender(const std::vector<ledger::TransactionRow> &rows,
                const std::optional<filter::EventFilter> &filter) {
  std::vector<SenderGroup> groups;
  std::unordered_map<std::string, std::size_t> index;

  for (const auto &row : rows) {
    if (filter && !filter->accepts({row.sender.value, row.target.value})) {
      continue;
    }

    auto [it, inserted] = index.try_emplace(row.sender.value, groups.size());
    if (inserted) {
      groups.push_back(SenderGroup{.sender = row.sender.value, .rows = {}});
    }
    groups[it->second].rows.push_back(row);
  }
  return groups;
}

std::string build_report(const ledger::Ledger &ledger,
                         const ReportOptions &options) {
  auto groups = group_by_sender(ledger.transactions().rows(), options.filter);
  if (groups.empty()) {
    return std::string{NO_RECORDS_MESSAGE};
  }

  const auto marker = stale_marker(options);
  Table table(make_columns(options));

  for (std::size_t g = 0; g < groups.size(); ++g) {
    std::optional<Style> style{};
    if (options.profile) {
      // Groups count from one: the first group takes the odd style
      style = (g + 1) % 2 ? options.profile->odd : options.profile->even;
    }

    bool first = true;
    for (const auto &row : groups[g].rows) {
      std::vector<std::string> cells;
      cells.push_back(first ? row.sender.value : "");
      cells.push_back(row.target.value);
      if (options.liveness) {
        cells.push_back(row.target.is_unresponsive() ? marker : "");
      }
      cells.push_back(std::to_string(row.count));
      if (options.reverse_names) {
        cells.push_back(first ? row.sender_name.value_or("") : "");
        cells.push_back(row.target_name.value_or(""));
      }

      table.add_row(std::move(cells), style);
      first = false;
    }
  }

  std::optional<Style> header_style{};
  if (options.profile) {
    header_style = options.profile->header;
  }
  return table.render(header_style);
}

} // namespace whohas::report
