#pragma once

#include <memory>

#include "internal/db/api/key_value_store.hpp"
#include "sqlite_db.hpp"

namespace hacktracker::db::sqlite {

/*
  KeyValueStore over a single sqlite table:

    kv_cache(key TEXT PRIMARY KEY, value TEXT NOT NULL, updated_at_ms INTEGER NOT NULL)

  The table is created on construction.
*/
class SqliteKeyValueStore final : public db::KeyValueStore {
 public:
  explicit SqliteKeyValueStore(std::shared_ptr<SqliteDB> db);

  std::optional<std::string> GetString(const std::string& key) override;
  Result                     SetString(const std::string& key, const std::string& value) override;
  Result                     Remove(const std::string& key) override;
  Result                     Clear() override;
  std::vector<std::string>   Keys() override;

 private:
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace hacktracker::db::sqlite
