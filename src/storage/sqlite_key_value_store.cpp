#include "storage/sqlite_key_value_store.hpp"

#include <sqlite3.h>

#include <string>
#include <system_error>

#include "my_error_codes.hpp"

namespace {
constexpr const char kCreateTableSql[] = R"SQL(
CREATE TABLE IF NOT EXISTS kv_store (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL,
  updated_at INTEGER NOT NULL DEFAULT (strftime('%s','now'))
);
)SQL";

constexpr const char kUpsertSql[] = R"SQL(
INSERT INTO kv_store(key, value, updated_at)
VALUES(?1, ?2, strftime('%s','now'))
ON CONFLICT(key) DO UPDATE SET
  value = excluded.value,
  updated_at = excluded.updated_at;
)SQL";

constexpr const char kDeleteSql[] = R"SQL(
DELETE FROM kv_store WHERE key = ?1;
)SQL";

constexpr const char kSelectSql[] = R"SQL(
SELECT value FROM kv_store WHERE key = ?1 LIMIT 1;
)SQL";

constexpr const char kSelectPrefixSql[] = R"SQL(
SELECT key, value FROM kv_store
WHERE substr(key, 1, length(?1)) = ?1
ORDER BY key;
)SQL";

constexpr const char kUnavailable[] = "State database unavailable";

monad::Error storage_error(std::string what) {
  return monad::make_error(my_errors::WORKFLOW::STORAGE_UNAVAILABLE,
                           std::move(what));
}

// Values may hold embedded NULs; the length comes from the column.
std::string column_string(sqlite3_stmt *stmt, int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  if (!text) {
    return {};
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
}
} // namespace

namespace kubeplane::storage {

SqliteKeyValueStore::SqliteKeyValueStore(
    IKubeplaneConfigProvider &config_provider, customio::ConsoleOutput &output)
    : config_provider_(config_provider), output_(output) {}

SqliteKeyValueStore::~SqliteKeyValueStore() {
  std::scoped_lock lock(mutex_);
  close_db();
}

bool SqliteKeyValueStore::available() const {
  std::scoped_lock lock(mutex_);
  return ensure_initialized();
}

std::filesystem::path SqliteKeyValueStore::db_path() const {
  std::scoped_lock lock(mutex_);
  return db_path_;
}

monad::MyResult<std::vector<IKeyValueStore::Entry>>
SqliteKeyValueStore::list_all(const std::string &prefix) {
  using ReturnType = monad::MyResult<std::vector<Entry>>;
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return ReturnType::Err(storage_error(kUnavailable));
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kSelectPrefixSql, -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return ReturnType::Err(
        storage_error("Failed to prepare prefix scan statement"));
  }
  sqlite3_bind_text(stmt, 1, prefix.data(), static_cast<int>(prefix.size()),
                    SQLITE_TRANSIENT);
  std::vector<Entry> entries;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    std::string full_key = column_string(stmt, 0);
    entries.emplace_back(full_key.substr(prefix.size()),
                         column_string(stmt, 1));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ReturnType::Err(
        storage_error("Failed to scan prefix " + prefix + ": " +
                      sqlite3_errmsg(db_)));
  }
  return ReturnType::Ok(std::move(entries));
}

monad::MyResult<std::string> SqliteKeyValueStore::get(const std::string &prefix,
                                                      const std::string &id) {
  using ReturnType = monad::MyResult<std::string>;
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return ReturnType::Err(storage_error(kUnavailable));
  }
  std::optional<std::string> value;
  if (auto err = read_value(prefix + id, value)) {
    return ReturnType::Err(storage_error(*err));
  }
  if (!value) {
    return ReturnType::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND, "key " + prefix + id + " not found"));
  }
  return ReturnType::Ok(std::move(*value));
}

monad::MyVoidResult SqliteKeyValueStore::put(const std::string &prefix,
                                             const std::string &id,
                                             const std::string &value) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return monad::MyVoidResult::Err(storage_error(kUnavailable));
  }
  if (auto err = upsert_value(prefix + id, value)) {
    return monad::MyVoidResult::Err(storage_error(*err));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult SqliteKeyValueStore::remove(const std::string &prefix,
                                                const std::string &id) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return monad::MyVoidResult::Err(storage_error(kUnavailable));
  }
  bool erased = false;
  if (auto err = erase_value(prefix + id, erased)) {
    return monad::MyVoidResult::Err(storage_error(*err));
  }
  if (!erased) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND, "key " + prefix + id + " not found"));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyResult<bool> SqliteKeyValueStore::compare_and_put(
    const std::string &prefix, const std::string &id,
    const std::optional<std::string> &expected, const std::string &value) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return monad::MyResult<bool>::Err(storage_error(kUnavailable));
  }
  const auto key = prefix + id;
  bool swapped = false;
  auto body = [&]() -> std::optional<std::string> {
    std::optional<std::string> current;
    if (auto err = read_value(key, current)) {
      return err;
    }
    const bool matches = expected ? (current && *current == *expected)
                                  : !current.has_value();
    if (!matches) {
      return std::nullopt;
    }
    if (auto err = upsert_value(key, value)) {
      return err;
    }
    swapped = true;
    return std::nullopt;
  };
  if (auto err = with_transaction(body)) {
    return monad::MyResult<bool>::Err(storage_error(*err));
  }
  return monad::MyResult<bool>::Ok(swapped);
}

bool SqliteKeyValueStore::ensure_initialized() const {
  if (initialized_) {
    return db_ != nullptr;
  }

  const auto &config = config_provider_.get();
  if (config.runtime_dir.empty()) {
    output_.logger().warning()
        << "Task store disabled: runtime_dir not configured" << std::endl;
    initialized_ = true;
    return false;
  }

  auto state_dir = config.runtime_dir / "state";
  std::error_code ec;
  std::filesystem::create_directories(state_dir, ec);
  if (ec) {
    output_.logger().error()
        << "Failed to create state directory '" << state_dir
        << "': " << ec.message() << std::endl;
    initialized_ = true;
    return false;
  }

  db_path_ = state_dir / config.state_db_file;
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr) !=
      SQLITE_OK) {
    output_.logger().error() << "Failed to open " << db_path_ << ": "
                             << sqlite3_errmsg(db_) << std::endl;
    close_db();
    initialized_ = true;
    return false;
  }

  sqlite3_busy_timeout(db_, 5000);
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                   &errmsg) != SQLITE_OK) {
    output_.logger().warning()
        << "Failed to enable WAL mode: " << (errmsg ? errmsg : "unknown")
        << std::endl;
    sqlite3_free(errmsg);
    errmsg = nullptr;
  }
  if (sqlite3_exec(db_, kCreateTableSql, nullptr, nullptr, &errmsg) !=
      SQLITE_OK) {
    output_.logger().error() << "Failed to initialize kv_store table: "
                             << (errmsg ? errmsg : "unknown") << std::endl;
    sqlite3_free(errmsg);
    close_db();
    initialized_ = true;
    return false;
  }

  initialized_ = true;
  return true;
}

void SqliteKeyValueStore::close_db() const {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

std::optional<std::string>
SqliteKeyValueStore::read_value(const std::string &key,
                                std::optional<std::string> &out) const {
  out.reset();
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kSelectSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return std::string{"Failed to prepare select statement"};
  }
  sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()),
                    SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    out = column_string(stmt, 0);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return std::string{"Failed to read key "} + key;
  }
  return std::nullopt;
}

std::optional<std::string>
SqliteKeyValueStore::upsert_value(const std::string &key,
                                  const std::string &value) const {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kUpsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return std::string{"Failed to prepare upsert statement"};
  }
  sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()),
                    SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, value.c_str(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return std::string{"Failed to upsert value for key "} + key;
  }
  return std::nullopt;
}

std::optional<std::string>
SqliteKeyValueStore::erase_value(const std::string &key, bool &erased) const {
  erased = false;
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kDeleteSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return std::string{"Failed to prepare delete statement"};
  }
  sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()),
                    SQLITE_TRANSIENT);
  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return std::string{"Failed to delete key "} + key;
  }
  erased = sqlite3_changes(db_) > 0;
  return std::nullopt;
}

std::optional<std::string> SqliteKeyValueStore::with_transaction(
    const std::function<std::optional<std::string>()> &body) const {
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, "BEGIN IMMEDIATE TRANSACTION;", nullptr, nullptr,
                   &errmsg) != SQLITE_OK) {
    std::string err = errmsg ? errmsg : "Failed to begin transaction";
    sqlite3_free(errmsg);
    return err;
  }

  auto body_err = body();
  if (body_err) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    return body_err;
  }

  if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
    std::string err = errmsg ? errmsg : "Failed to commit transaction";
    sqlite3_free(errmsg);
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    return err;
  }
  return std::nullopt;
}

} // namespace kubeplane::storage
