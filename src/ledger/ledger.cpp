#include "ledger.hpp"

namespace whohas::ledger {

Ledger::Ledger(const std::filesystem::path &path, storage::OpenMode mode)
    : db_(std::make_unique<storage::Database>(path, mode)), registry_(*db_),
      transactions_(*db_) {}

} // namespace whohas::ledger
