#include "transaction_ledger.hpp"

#include "logger.hpp"
#include <limits>
#include <stdexcept>

namespace whohas::ledger {

namespace {

// The canonical reverse name is the first one stored for the address
constexpr std::string_view ROWS_QUERY = R"sql(
SELECT s.id, s.value, s.mac_address, s.resolve_attempted,
       d.id, d.value, d.mac_address, d.resolve_attempted,
       (SELECT value FROM reverse_name WHERE address_id = s.id
        ORDER BY id LIMIT 1),
       (SELECT value FROM reverse_name WHERE address_id = d.id
        ORDER BY id LIMIT 1),
       t.count
FROM arp_transaction t
JOIN address s ON s.id = t.sender_id
JOIN address d ON d.id = t.target_id
ORDER BY t.count DESC, t.id ASC
)sql";

} // namespace

Transaction TransactionLedger::add(const AddressEntity &sender,
                                   const AddressEntity &target,
                                   uint64_t count) {
  if (count == 0) {
    throw std::invalid_argument("Transaction count increment must be positive");
  }
  if (count > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw std::invalid_argument("Transaction count increment is too large");
  }

  auto guard = db_->lock();
  auto upsert = db_->prepare(
      "INSERT INTO arp_transaction (sender_id, target_id, count) "
      "VALUES (?1, ?2, ?3) "
      "ON CONFLICT (sender_id, target_id) "
      "DO UPDATE SET count = count + excluded.count "
      "RETURNING count");
  upsert.bind(1, sender.id).bind(2, target.id).bind(3,
                                                    static_cast<int64_t>(count));
  if (!upsert.step()) {
    throw std::logic_error("Transaction upsert returned no row");
  }
  Transaction transaction{
      .sender_id = sender.id,
      .target_id = target.id,
      .count = static_cast<uint64_t>(upsert.column_int(0)),
  };
  while (upsert.step()) {
  }

  LOG_TRACE("Transaction {} -> {} now at {}", sender.value, target.value,
            transaction.count);
  return transaction;
}

std::optional<Transaction>
TransactionLedger::find(entity_id_t sender_id, entity_id_t target_id) const {
  auto guard = db_->lock();
  auto select = db_->prepare("SELECT count FROM arp_transaction "
                             "WHERE sender_id = ?1 AND target_id = ?2");
  select.bind(1, sender_id).bind(2, target_id);
  if (!select.step()) {
    return std::nullopt;
  }
  return Transaction{
      .sender_id = sender_id,
      .target_id = target_id,
      .count = static_cast<uint64_t>(select.column_int(0)),
  };
}

std::vector<TransactionRow> TransactionLedger::rows() const {
  std::vector<TransactionRow> rows{};

  auto guard = db_->lock();
  auto select = db_->prepare(ROWS_QUERY);
  while (select.step()) {
    rows.push_back(TransactionRow{
        .sender = {.id = select.column_int(0),
                   .value = select.column_text(1),
                   .mac_address = select.column_optional_text(2),
                   .resolve_attempted = select.column_int(3) != 0},
        .target = {.id = select.column_int(4),
                   .value = select.column_text(5),
                   .mac_address = select.column_optional_text(6),
                   .resolve_attempted = select.column_int(7) != 0},
        .sender_name = select.column_optional_text(8),
        .target_name = select.column_optional_text(9),
        .count = static_cast<uint64_t>(select.column_int(10)),
    });
  }
  return rows;
}

std::size_t TransactionLedger::size() const {
  auto guard = db_->lock();
  auto select = db_->prepare("SELECT COUNT(*) FROM arp_transaction");
  select.step();
  return static_cast<std::size_t>(select.column_int(0));
}

} // namespace whohas::ledger
