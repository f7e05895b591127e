#include "sqlite_kv_store.hpp"

#include <sqlite3.h>

#include "internal/util/time.hpp"

namespace hacktracker::db::sqlite {

using hacktracker::db::ErrorCode;
using hacktracker::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

SqliteKeyValueStore::SqliteKeyValueStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("CREATE TABLE IF NOT EXISTS kv_cache (key TEXT PRIMARY KEY, value TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);");
}

Result SqliteKeyValueStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

std::optional<std::string> SqliteKeyValueStore::GetString(const std::string& key) {
  auto* db = db_->Handle();

  const char* sql = "SELECT value FROM kv_cache WHERE key=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
    return std::nullopt;

  BindText(st, 1, key);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto value = ColText(st, 0);
  sqlite3_finalize(st);
  return value;
}

Result SqliteKeyValueStore::SetString(const std::string& key, const std::string& value) {
  auto* db = db_->Handle();

  const char* sql = "INSERT OR REPLACE INTO kv_cache(key,value,updated_at_ms) VALUES(?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, key);
  BindText(st, 2, value);
  BindU64(st, 3, util::ToUnixMillis(util::Now()));

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

Result SqliteKeyValueStore::Remove(const std::string& key) {
  auto* db = db_->Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM kv_cache WHERE key=?;", -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, key);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

Result SqliteKeyValueStore::Clear() {
  auto* db = db_->Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM kv_cache;", -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::vector<std::string> SqliteKeyValueStore::Keys() {
  auto* db = db_->Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "SELECT key FROM kv_cache ORDER BY key;", -1, &st, nullptr) != SQLITE_OK)
    return {};

  std::vector<std::string> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ColText(st, 0));
  }

  sqlite3_finalize(st);
  return out;
}

} // namespace hacktracker::db::sqlite
