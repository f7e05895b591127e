#pragma once

#include <google/protobuf/repeated_field.h>

#include <vector>

#include "game_state.hpp"
#include "hacktracker/scoring/v1.hpp"

namespace hacktracker::scoring {

using AtBats = std::vector<hacktracker::scoring::v1::AtBat>;
using Lineup = std::vector<hacktracker::scoring::v1::LineupSlot>;

/*
  Replays an at-bat log into the current InGameState.

  Pure: the same (events, lineup) always yields the same state, so the
  result can be rebuilt after a crash, on another device, or for audit.

  Ordering: created_at, then sequence, then at_bat_id. Every at-bat moves
  to the next batter, whatever its result.

  Throws util::ValidationError for an empty or inconsistent lineup and for
  malformed events (missing id or blank result).
*/
class GameStateReducer {
 public:
  static InGameState Compute(const AtBats& events, const Lineup& lineup);

  // State before the first pitch.
  static InGameState Initial(const Lineup& lineup);

  // Sorted copies in replay order.
  static AtBats OrderEvents(const AtBats& events);
  static Lineup OrderLineup(const Lineup& lineup);

  // Strict replay ordering used by OrderEvents.
  static bool Precedes(const hacktracker::scoring::v1::AtBat& a, const hacktracker::scoring::v1::AtBat& b);
};

// Adapters for protobuf containers (Game::lineup(), AtBatList::at_bats()).
Lineup ToLineup(const google::protobuf::RepeatedPtrField<hacktracker::scoring::v1::LineupSlot>& slots);
AtBats ToAtBats(const google::protobuf::RepeatedPtrField<hacktracker::scoring::v1::AtBat>& at_bats);

} // namespace hacktracker::scoring
