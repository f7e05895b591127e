#pragma once

#include <ostream>
#include <string>

namespace hacktracker::scoring {

class GameStateReducer;

/*
  Derived in-game state: inning, outs and who is up.

  Always recomputable from (at-bats, lineup); never stored as a source of
  truth. Only GameStateReducer builds populated values.
*/
class InGameState {
 public:
  int inning() const {
    return inning_;
  }
  int outs() const {
    return outs_;
  }
  int batter_index() const {
    return batter_index_;
  }
  const std::string& batter_player_id() const {
    return batter_player_id_;
  }

  bool operator==(const InGameState& other) const {
    return inning_ == other.inning_ && outs_ == other.outs_ && batter_index_ == other.batter_index_ &&
           batter_player_id_ == other.batter_player_id_;
  }
  bool operator!=(const InGameState& other) const {
    return !(*this == other);
  }

  std::string ToString() const;

 private:
  friend class GameStateReducer;

  InGameState(int inning, int outs, int batter_index, std::string batter_player_id)
      : inning_(inning), outs_(outs), batter_index_(batter_index), batter_player_id_(std::move(batter_player_id)) {
  }

  int         inning_       = 1;
  int         outs_         = 0;
  int         batter_index_ = 0;
  std::string batter_player_id_;
};

inline std::ostream& operator<<(std::ostream& os, const InGameState& state) {
  return os << state.ToString();
}

} // namespace hacktracker::scoring
