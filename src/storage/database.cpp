#include "database.hpp"

#include "error.hpp"
#include "logger.hpp"
#include <fmt/format.h>
#include <sqlite3.h>
#include <system_error>
#include <utility>

namespace whohas::storage {

namespace {

constexpr std::string_view SCHEMA = R"sql(
CREATE TABLE IF NOT EXISTS address (
  id INTEGER PRIMARY KEY,
  value TEXT NOT NULL UNIQUE,
  mac_address TEXT,
  resolve_attempted INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS reverse_name (
  id INTEGER PRIMARY KEY,
  address_id INTEGER NOT NULL REFERENCES address(id),
  value TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS reverse_name_address ON reverse_name(address_id);
CREATE TABLE IF NOT EXISTS arp_transaction (
  id INTEGER PRIMARY KEY,
  sender_id INTEGER NOT NULL REFERENCES address(id),
  target_id INTEGER NOT NULL REFERENCES address(id),
  count INTEGER NOT NULL DEFAULT 1 CHECK (count > 0),
  UNIQUE (sender_id, target_id)
);
)sql";

[[noreturn]] void throw_sqlite_error(sqlite3 *db, std::string_view context) {
  throw StorageError(
      fmt::format("{}: {}", context, db ? sqlite3_errmsg(db) : "out of memory"));
}

} // namespace

Statement::Statement(sqlite3 *db, std::string_view sql) : db_(db) {
  if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_,
                         nullptr) != SQLITE_OK) {
    throw_sqlite_error(db_, "Failed to prepare statement");
  }
}

Statement::~Statement() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

Statement::Statement(Statement &&other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement &Statement::operator=(Statement &&other) noexcept {
  if (this != &other) {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
    db_ = other.db_;
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

Statement &Statement::bind(int index, int64_t value) {
  if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
    throw_sqlite_error(db_, "Failed to bind integer");
  }
  return *this;
}

Statement &Statement::bind(int index, std::string_view value) {
  if (sqlite3_bind_text(stmt_, index, value.data(),
                        static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    throw_sqlite_error(db_, "Failed to bind text");
  }
  return *this;
}

Statement &Statement::bind(int index, const std::optional<std::string> &value) {
  if (!value) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
      throw_sqlite_error(db_, "Failed to bind null");
    }
    return *this;
  }
  return bind(index, std::string_view{*value});
}

bool Statement::step() {
  switch (sqlite3_step(stmt_)) {
  case SQLITE_ROW:
    return true;
  case SQLITE_DONE:
    return false;
  default:
    throw_sqlite_error(db_, "Failed to execute statement");
  }
}

void Statement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

int64_t Statement::column_int(int index) const {
  return sqlite3_column_int64(stmt_, index);
}

std::string Statement::column_text(int index) const {
  const auto *text =
      reinterpret_cast<const char *>(sqlite3_column_text(stmt_, index));
  if (!text) {
    return {};
  }
  return std::string(text, sqlite3_column_bytes(stmt_, index));
}

std::optional<std::string> Statement::column_optional_text(int index) const {
  if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(index);
}

Database::Database(const std::filesystem::path &path, OpenMode mode)
    : path_(path) {
  const bool in_memory = path.native() == IN_MEMORY;
  int flags = SQLITE_OPEN_FULLMUTEX;

  switch (mode) {
  case OpenMode::existing:
    if (!in_memory && !std::filesystem::is_regular_file(path)) {
      throw FileNotFound(path.string());
    }
    flags |= SQLITE_OPEN_READONLY;
    read_only_ = true;
    break;
  case OpenMode::overwrite:
    if (!in_memory) {
      std::error_code ec;
      std::filesystem::remove(path, ec);
      if (ec) {
        throw StorageError(fmt::format("Failed to remove {}: {}",
                                       path.string(), ec.message()));
      }
    }
    flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    break;
  case OpenMode::open_or_create:
    flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    break;
  }

  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string message =
        fmt::format("Failed to open database {}: {}", path.string(),
                    db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError(message);
  }

  // Concurrent connections from another process back off instead of failing
  sqlite3_busy_timeout(db_, 5000);

  if (!read_only_) {
    try {
      create_schema();
    } catch (...) {
      sqlite3_close(db_);
      db_ = nullptr;
      throw;
    }
  }

  LOG_DEBUG("Opened ledger database {}{}", path.string(),
            read_only_ ? " (read-only)" : "");
}

Database::~Database() {
  if (db_) {
    sqlite3_close(db_);
  }
}

Statement Database::prepare(std::string_view sql) const {
  return Statement(db_, sql);
}

void Database::execute(std::string_view sql) {
  char *error_message = nullptr;
  if (sqlite3_exec(db_, std::string(sql).c_str(), nullptr, nullptr,
                   &error_message) != SQLITE_OK) {
    std::string message = error_message ? error_message : "unknown error";
    sqlite3_free(error_message);
    throw StorageError(fmt::format("Failed to execute SQL: {}", message));
  }
}

void Database::create_schema() {
  auto guard = lock();
  execute(SCHEMA);
}

} // namespace whohas::storage
