#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/api/scoring_api.hpp"
#include "internal/cache/persistent_cache_store.hpp"
#include "internal/collection/collection_registry.hpp"
#include "internal/db/api/key_value_store.hpp"
#include "internal/game_state/game_state_cache.hpp"
#include "internal/notify/messenger.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/session/session.hpp"
#include "internal/util/time.hpp"

namespace hacktracker::factory {

/*
  Application

  Owns all long-lived objects of one signed-in client.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<runtime::EventLoop>             loop;
  std::shared_ptr<db::KeyValueStore>              store;
  std::shared_ptr<cache::PersistentCacheStore>    cache;
  std::shared_ptr<collection::CollectionRegistry> registry;
  std::shared_ptr<game_state::GameStateCache>     game_state;
  std::shared_ptr<session::Session>               session;
};

/*
  Build

  Composition root. The only place that knows the concrete key/value store.
  The ScoringApi transport comes from the host; a null messenger means
  LoggingMessenger.
*/
Application Build(const hacktracker::runtime::config::RuntimeConfig& config, std::shared_ptr<api::ScoringApi> api,
                  std::shared_ptr<notify::Messenger> messenger, util::NowFn now = util::Now);

// Storage backend selected by config.storage().
std::shared_ptr<db::KeyValueStore> BuildKeyValueStore(const hacktracker::runtime::config::RuntimeConfig& config);

// Persistent cache over the configured store, schema version already checked.
std::shared_ptr<cache::PersistentCacheStore> BuildCacheStore(const hacktracker::runtime::config::RuntimeConfig& config,
                                                             util::NowFn now = util::Now);

} // namespace hacktracker::factory
