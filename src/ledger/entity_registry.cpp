#include "entity_registry.hpp"

#include "logger.hpp"
#include <stdexcept>
#include <utility>

namespace whohas::ledger {

namespace {

constexpr std::string_view SELECT_COLUMNS =
    "SELECT id, value, mac_address, resolve_attempted FROM address ";

AddressEntity read_entity(const storage::Statement &stmt) {
  return AddressEntity{
      .id = stmt.column_int(0),
      .value = stmt.column_text(1),
      .mac_address = stmt.column_optional_text(2),
      .resolve_attempted = stmt.column_int(3) != 0,
  };
}

} // namespace

GetOrCreateResult EntityRegistry::resolve_or_create(std::string_view address) {
  if (address.empty()) {
    throw std::invalid_argument("Address value must not be empty");
  }

  auto guard = db_->lock();

  // RETURNING yields a row only when the insert happened; a conflict with an
  // existing value yields nothing and we fall back to fetching that row
  auto insert = db_->prepare(
      "INSERT INTO address (value) VALUES (?1) ON CONFLICT (value) DO NOTHING "
      "RETURNING id, value, mac_address, resolve_attempted");
  insert.bind(1, address);
  if (insert.step()) {
    auto entity = read_entity(insert);
    // Drain the statement so the insert is committed
    while (insert.step()) {
    }
    LOG_DEBUG("Created address entity {} -> {}", entity.value, entity.id);
    return {std::move(entity), true};
  }

  auto select = db_->prepare(std::string(SELECT_COLUMNS) + "WHERE value = ?1");
  select.bind(1, address);
  if (!select.step()) {
    throw std::logic_error("Address vanished after a conflicting insert");
  }
  return {read_entity(select), false};
}

std::optional<AddressEntity>
EntityRegistry::find(std::string_view address) const {
  auto guard = db_->lock();
  auto select = db_->prepare(std::string(SELECT_COLUMNS) + "WHERE value = ?1");
  select.bind(1, address);
  if (!select.step()) {
    return std::nullopt;
  }
  return read_entity(select);
}

std::optional<AddressEntity> EntityRegistry::find(entity_id_t id) const {
  auto guard = db_->lock();
  auto select = db_->prepare(std::string(SELECT_COLUMNS) + "WHERE id = ?1");
  select.bind(1, id);
  if (!select.step()) {
    return std::nullopt;
  }
  return read_entity(select);
}

bool EntityRegistry::record_probe_result(
    entity_id_t id, const std::optional<std::string> &mac_address) {
  auto guard = db_->lock();
  auto update = db_->prepare(
      "UPDATE address SET mac_address = ?2, resolve_attempted = 1 "
      "WHERE id = ?1 AND resolve_attempted = 0 RETURNING id");
  update.bind(1, id).bind(2, mac_address);

  const bool updated = update.step();
  while (updated && update.step()) {
  }
  return updated;
}

bool EntityRegistry::add_reverse_name(entity_id_t id, std::string_view name) {
  auto guard = db_->lock();
  auto insert = db_->prepare(
      "INSERT INTO reverse_name (address_id, value) SELECT ?1, ?2 "
      "WHERE NOT EXISTS (SELECT 1 FROM reverse_name WHERE address_id = ?1) "
      "RETURNING id");
  insert.bind(1, id).bind(2, name);

  const bool inserted = insert.step();
  while (inserted && insert.step()) {
  }
  return inserted;
}

std::optional<std::string> EntityRegistry::reverse_name(entity_id_t id) const {
  auto guard = db_->lock();
  auto select = db_->prepare("SELECT value FROM reverse_name "
                             "WHERE address_id = ?1 ORDER BY id LIMIT 1");
  select.bind(1, id);
  if (!select.step()) {
    return std::nullopt;
  }
  return select.column_text(0);
}

std::size_t EntityRegistry::size() const {
  auto guard = db_->lock();
  auto select = db_->prepare("SELECT COUNT(*) FROM address");
  select.step();
  return static_cast<std::size_t>(select.column_int(0));
}

} // namespace whohas::ledger
