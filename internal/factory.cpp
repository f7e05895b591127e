#include "factory.hpp"

#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_kv_store.hpp"
#include "internal/observability/logging.hpp"

namespace hacktracker::factory {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

std::shared_ptr<db::KeyValueStore> BuildKeyValueStore(const hacktracker::runtime::config::RuntimeConfig& config) {
  const auto& storage = config.storage();
  if (storage.has_sqlite()) {
    HACKTRACKER_LOG_INFO("using sqlite cache store",
                         {StringField("path", storage.sqlite().path()), BoolField("wal_mode", storage.sqlite().wal_mode())});
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(storage.sqlite().path(), storage.sqlite().wal_mode());
    return std::make_shared<db::sqlite::SqliteKeyValueStore>(std::move(sqlite_db));
  }

  HACKTRACKER_LOG_INFO("using in-memory cache store");
  return std::make_shared<db::memory::MemoryKeyValueStore>();
}

std::shared_ptr<cache::PersistentCacheStore> BuildCacheStore(const hacktracker::runtime::config::RuntimeConfig& config, util::NowFn now) {
  auto cache = std::make_shared<cache::PersistentCacheStore>(BuildKeyValueStore(config), config.cache().schema_version(),
                                                             util::ToSeconds(config.cache().default_ttl()), std::move(now));
  cache->CheckSchemaVersion();
  return cache;
}

Application Build(const hacktracker::runtime::config::RuntimeConfig& config, std::shared_ptr<api::ScoringApi> api,
                  std::shared_ptr<notify::Messenger> messenger, util::NowFn now) {
  Application app;

  if (!messenger) {
    messenger = std::make_shared<notify::LoggingMessenger>();
  }

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.store = BuildKeyValueStore(config);
  app.cache = std::make_shared<cache::PersistentCacheStore>(app.store, config.cache().schema_version(),
                                                            util::ToSeconds(config.cache().default_ttl()), now);
  app.cache->CheckSchemaVersion();

  // ------------------------------------------------------------------
  // Collections and derived state
  // ------------------------------------------------------------------
  app.loop     = std::make_shared<runtime::EventLoop>(now);
  app.registry = std::make_shared<collection::CollectionRegistry>(std::move(api), app.cache, std::move(messenger), now);

  const auto keep_alive = util::ToSeconds(config.game_state().keep_alive());
  app.game_state        = game_state::GameStateCache::Create(app.registry, app.loop, keep_alive);
  app.session           = std::make_shared<session::Session>(app.cache, app.registry, app.game_state);

  HACKTRACKER_LOG_INFO("runtime ready", {IntField("cache_schema_version", config.cache().schema_version()),
                                         IntField("keep_alive_s", keep_alive.count())});
  return app;
}

} // namespace hacktracker::factory
