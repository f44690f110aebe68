#pragma once

#include "entity_registry.hpp"
#include "storage/database.hpp"
#include "transaction_ledger.hpp"
#include <filesystem>
#include <memory>

namespace whohas::ledger {

/**
 * @brief The store of one capture or analysis session
 *
 * Owns the database connection together with the registry and the
 * transaction ledger that write to it.
 */
class Ledger {
public:
  explicit Ledger(const std::filesystem::path &path,
                  storage::OpenMode mode = storage::OpenMode::open_or_create);

  static Ledger in_memory() { return Ledger(storage::Database::IN_MEMORY); }

  Ledger(const Ledger &) = delete;
  Ledger &operator=(const Ledger &) = delete;
  Ledger(Ledger &&) = default;
  Ledger &operator=(Ledger &&) = default;

  EntityRegistry &registry() { return registry_; }
  const EntityRegistry &registry() const { return registry_; }

  TransactionLedger &transactions() { return transactions_; }
  const TransactionLedger &transactions() const { return transactions_; }

  bool empty() const { return transactions_.empty(); }

  const std::filesystem::path &path() const { return db_->path(); }

private:
  // Heap-allocated so the registry and the ledger keep a stable pointer to it
  // when the Ledger is moved
  std::unique_ptr<storage::Database> db_;
  EntityRegistry registry_;
  TransactionLedger transactions_;
};

} // namespace whohas::ledger
