#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace whohas::storage {

enum class OpenMode {
  // Open the file, creating it (and the schema) when missing
  open_or_create,
  // Remove any existing file and start from an empty schema
  overwrite,
  // Open an existing file read-only, fail if it does not exist
  existing
};

class Statement {
public:
  Statement(sqlite3 *db, std::string_view sql);
  ~Statement();

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;
  Statement(Statement &&other) noexcept;
  Statement &operator=(Statement &&other) noexcept;

  // Parameters are 1-indexed, like in the sqlite3 API
  Statement &bind(int index, int64_t value);
  Statement &bind(int index, std::string_view value);
  Statement &bind(int index, const std::optional<std::string> &value);

  /**
   * @brief Advance the statement
   *
   * @return true if a row is available, false once the statement is done
   *
   * @throws StorageError if the statement fails
   */
  bool step();

  void reset();

  int64_t column_int(int index) const;
  std::string column_text(int index) const;
  std::optional<std::string> column_optional_text(int index) const;

private:
  sqlite3 *db_{nullptr};
  sqlite3_stmt *stmt_{nullptr};
};

/**
 * @brief A single SQLite connection holding one ledger
 *
 * All statements go through lock(); the registry, the transaction ledger and
 * the enrichment workers share one connection and must not interleave the
 * statements of a single operation.
 */
class Database {
public:
  static constexpr std::string_view IN_MEMORY{":memory:"};

  /**
   * @brief Open (or create) a ledger database
   *
   * @param path The database file, or IN_MEMORY
   * @param mode How to treat an existing or missing file
   *
   * @throws FileNotFound if mode is existing and the file is missing
   * @throws StorageError if the database cannot be opened or initialized
   */
  explicit Database(const std::filesystem::path &path,
                    OpenMode mode = OpenMode::open_or_create);
  ~Database();

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;
  Database(Database &&) = delete;
  Database &operator=(Database &&) = delete;

  [[nodiscard]] std::unique_lock<std::mutex> lock() const {
    return std::unique_lock{mutex_};
  }

  // The caller must hold lock() while the statement is alive
  [[nodiscard]] Statement prepare(std::string_view sql) const;

  void execute(std::string_view sql);

  const std::filesystem::path &path() const { return path_; }

  bool read_only() const { return read_only_; }

private:
  void create_schema();

  std::filesystem::path path_;
  sqlite3 *db_{nullptr};
  bool read_only_{false};
  mutable std::mutex mutex_{};
};

} // namespace whohas::storage
