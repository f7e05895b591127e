#pragma once

#include <string>

namespace hacktracker::cache::keys {

// Holds the schema version the cache was written with.
constexpr char kCacheVersion[] = "cache_version";

inline std::string Games(const std::string& team_id) {
  return "games_cache_" + team_id;
}

inline std::string Game(const std::string& game_id) {
  return "game_" + game_id;
}

inline std::string AtBats(const std::string& game_id) {
  return "atbats_cache_" + game_id;
}

inline std::string AtBat(const std::string& at_bat_id) {
  return "atbat_" + at_bat_id;
}

} // namespace hacktracker::cache::keys
