#pragma once

#include "entity_registry.hpp"
#include "storage/database.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace whohas::ledger {

struct Transaction {
  entity_id_t sender_id{};
  entity_id_t target_id{};
  uint64_t count{};
};

// One transaction joined with both of its entities and their reverse names
struct TransactionRow {
  AddressEntity sender;
  AddressEntity target;
  std::optional<std::string> sender_name{};
  std::optional<std::string> target_name{};
  uint64_t count{};
};

class TransactionLedger {
public:
  explicit TransactionLedger(storage::Database &db) : db_(&db) {}

  /**
   * @brief Count one more "sender asked for target" request
   *
   * @return The transaction after the update (count 1 if it was just created)
   */
  Transaction record(const AddressEntity &sender, const AddressEntity &target) {
    return add(sender, target, 1);
  }

  /**
   * @brief Add count occurrences to the (sender, target) transaction
   *
   * The lookup, creation and increment happen in a single upsert statement,
   * so concurrent updates of the same pair never lose a count.
   *
   * @throws std::invalid_argument if count is 0
   * @throws StorageError if the database rejects the operation
   */
  Transaction add(const AddressEntity &sender, const AddressEntity &target,
                  uint64_t count);

  std::optional<Transaction> find(entity_id_t sender_id,
                                  entity_id_t target_id) const;

  /**
   * @brief Retrieve every transaction with its entities
   *
   * @return Rows ordered by descending count, ties in creation order
   */
  std::vector<TransactionRow> rows() const;

  std::size_t size() const;

  bool empty() const { return size() == 0; }

private:
  storage::Database *db_;
};

} // namespace whohas::ledger
