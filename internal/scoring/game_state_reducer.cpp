#include "game_state_reducer.hpp"

#include <algorithm>
#include <sstream>
#include <tuple>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "scoring_rules.hpp"

namespace hacktracker::scoring {

using hacktracker::scoring::v1::AtBat;
using hacktracker::scoring::v1::LineupSlot;

namespace {

constexpr int kOutsPerInning = 3;

void ValidateLineup(const Lineup& lineup) {
  if (lineup.empty()) {
    throw util::ValidationError("lineup cannot be empty");
  }

  std::unordered_set<int> orders;
  for (const auto& slot : lineup) {
    if (slot.player_id().empty()) {
      throw util::ValidationError("lineup slot has no player id");
    }
    if (slot.batting_order() <= 0) {
      throw util::ValidationError("batting order must be positive for player " + slot.player_id());
    }
    if (!orders.insert(slot.batting_order()).second) {
      throw util::ValidationError("duplicate batting order " + std::to_string(slot.batting_order()));
    }
  }
}

void ValidateEvent(const AtBat& event) {
  if (event.at_bat_id().empty()) {
    throw util::ValidationError("at-bat has no id");
  }
  if (Normalize(event.result()).empty()) {
    throw util::ValidationError("at-bat " + event.at_bat_id() + " has no result");
  }
}

} // namespace

std::string InGameState::ToString() const {
  std::ostringstream out;
  out << "InGameState(inning: " << inning_ << ", outs: " << outs_ << ", batterIndex: " << batter_index_
      << ", playerId: " << batter_player_id_ << ")";
  return out.str();
}

bool GameStateReducer::Precedes(const AtBat& a, const AtBat& b) {
  const auto key_a = std::make_tuple(a.created_at().seconds(), a.created_at().nanos(), a.sequence());
  const auto key_b = std::make_tuple(b.created_at().seconds(), b.created_at().nanos(), b.sequence());
  if (key_a != key_b) return key_a < key_b;
  return a.at_bat_id() < b.at_bat_id();
}

AtBats GameStateReducer::OrderEvents(const AtBats& events) {
  AtBats ordered(events);
  std::stable_sort(ordered.begin(), ordered.end(), &GameStateReducer::Precedes);
  return ordered;
}

Lineup GameStateReducer::OrderLineup(const Lineup& lineup) {
  Lineup ordered(lineup);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const LineupSlot& a, const LineupSlot& b) { return a.batting_order() < b.batting_order(); });
  return ordered;
}

InGameState GameStateReducer::Initial(const Lineup& lineup) {
  return Compute({}, lineup);
}

InGameState GameStateReducer::Compute(const AtBats& events, const Lineup& lineup) {
  ValidateLineup(lineup);
  for (const auto& event : events) {
    ValidateEvent(event);
  }

  const auto batting_order = OrderLineup(lineup);
  const auto log           = OrderEvents(events);
  const auto lineup_size   = static_cast<int>(batting_order.size());

  int inning       = 1;
  int outs         = 0;
  int batter_index = 0;

  for (const auto& event : log) {
    outs += OutCount(event.result());
    while (outs >= kOutsPerInning) {
      ++inning;
      outs -= kOutsPerInning;
    }

    batter_index = (batter_index + 1) % lineup_size;
  }

  return InGameState(inning, outs, batter_index, batting_order[batter_index].player_id());
}

Lineup ToLineup(const google::protobuf::RepeatedPtrField<LineupSlot>& slots) {
  return Lineup(slots.begin(), slots.end());
}

AtBats ToAtBats(const google::protobuf::RepeatedPtrField<AtBat>& at_bats) {
  return AtBats(at_bats.begin(), at_bats.end());
}

} // namespace hacktracker::scoring
