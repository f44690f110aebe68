#pragma once

#include "storage/database.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace whohas::ledger {

using entity_id_t = int64_t;

struct AddressEntity {
  // A probe was made and nobody answered
  bool is_unresponsive() const { return resolve_attempted && !mac_address; }

  entity_id_t id{};
  std::string value;
  std::optional<std::string> mac_address{};
  bool resolve_attempted{false};
};

struct GetOrCreateResult {
  AddressEntity entity;
  // True only for the single call that inserted the entity
  bool created{false};
};

/**
 * @brief The sole writer of address entities and their annotations
 *
 * Identity is enforced by the UNIQUE constraint on address.value: creation is
 * an insert that does nothing on conflict, followed by a re-fetch, so
 * concurrent callers always converge on the same row.
 */
class EntityRegistry {
public:
  explicit EntityRegistry(storage::Database &db) : db_(&db) {}

  /**
   * @brief Get the entity for an address, creating it on first observation
   *
   * @param address The address value (dotted-quad IPv4)
   * @return The entity and whether this call created it
   *
   * @throws std::invalid_argument if the address is empty
   * @throws StorageError if the database rejects the operation
   */
  [[nodiscard]] GetOrCreateResult resolve_or_create(std::string_view address);

  std::optional<AddressEntity> find(std::string_view address) const;

  std::optional<AddressEntity> find(entity_id_t id) const;

  /**
   * @brief Record the outcome of the one liveness probe of an entity
   *
   * Sets resolve_attempted and, when the target answered, mac_address. The
   * update only applies while resolve_attempted is still false.
   *
   * @return true if this call recorded the attempt, false if one was already
   * recorded
   */
  bool record_probe_result(entity_id_t id,
                           const std::optional<std::string> &mac_address);

  /**
   * @brief Attach a reverse name to an entity that has none yet
   *
   * @return true if the record was stored, false if the entity already has
   * one
   */
  bool add_reverse_name(entity_id_t id, std::string_view name);

  // The canonical (first stored) reverse name of an entity
  std::optional<std::string> reverse_name(entity_id_t id) const;

  std::size_t size() const;

private:
  storage::Database *db_;
};

} // namespace whohas::ledger
