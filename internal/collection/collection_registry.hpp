#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "atbat_collection.hpp"
#include "game_collection.hpp"

namespace hacktracker::collection {

/*
  Owns one AtBatCollection per game and one GameCollection per team,
  created on first use and kept for the process lifetime.
*/
class CollectionRegistry {
 public:
  CollectionRegistry(std::shared_ptr<api::ScoringApi> api, std::shared_ptr<cache::PersistentCacheStore> cache,
                     std::shared_ptr<notify::Messenger> messenger, util::NowFn now = util::Now);

  std::shared_ptr<AtBatCollection> AtBats(const std::string& game_id);
  std::shared_ptr<GameCollection>  Games(const std::string& team_id);

  // Sign-out. Live collections are detached (back to Loading, pending
  // fetches discarded), then the registry forgets them.
  void Reset();

  std::size_t size() const {
    return at_bats_.size() + games_.size();
  }

 private:
  std::shared_ptr<api::ScoringApi>             api_;
  std::shared_ptr<cache::PersistentCacheStore> cache_;
  std::shared_ptr<notify::Messenger>           messenger_;
  util::NowFn                                  now_;

  std::unordered_map<std::string, std::shared_ptr<AtBatCollection>> at_bats_;
  std::unordered_map<std::string, std::shared_ptr<GameCollection>>  games_;
};

} // namespace hacktracker::collection
