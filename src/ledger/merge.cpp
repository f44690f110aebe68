#include "merge.hpp"

#include "logger.hpp"
#include <optional>
#include <string>

namespace whohas::ledger {

namespace {

AddressEntity import_entity(EntityRegistry &registry, const AddressEntity &entity,
                            const std::optional<std::string> &reverse_name,
                            MergeSummary &summary) {
  auto [imported, created] = registry.resolve_or_create(entity.value);
  if (created) {
    ++summary.created_entities;
    if (reverse_name) {
      registry.add_reverse_name(imported.id, *reverse_name);
    }
  }
  return imported;
}

} // namespace

MergeSummary merge(Ledger &destination, const Ledger &source) {
  MergeSummary summary{};

  for (const auto &row : source.transactions().rows()) {
    auto sender = import_entity(destination.registry(), row.sender,
                                row.sender_name, summary);
    auto target = import_entity(destination.registry(), row.target,
                                row.target_name, summary);

    destination.transactions().add(sender, target, row.count);

    ++summary.transactions;
    summary.requests += row.count;
  }

  LOG_INFO("Merged {} transactions ({} requests, {} new addresses) from {}",
           summary.transactions, summary.requests, summary.created_entities,
           source.path().string());
  return summary;
}

} // namespace whohas::ledger
