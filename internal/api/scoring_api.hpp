#pragma once

#include <string>
#include <vector>

#include "api_result.hpp"
#include "hacktracker/scoring/v1.hpp"

namespace hacktracker::api {

/*
  Remote at-bat / game endpoints.

  Implemented by the authenticated HTTP transport, which lives outside this
  core. Failures are reported as util::TransportError through the callback,
  never thrown to the caller; a 401 is just another failure here.
*/
class ScoringApi {
 public:
  virtual ~ScoringApi() = default;

  virtual void ListAtBats(const std::string& game_id, ApiCallback<hacktracker::scoring::v1::AtBatList> done) = 0;

  virtual void CreateAtBat(const hacktracker::scoring::v1::CreateAtBatRequest& request,
                           ApiCallback<hacktracker::scoring::v1::AtBat>         done) = 0;

  virtual void UpdateAtBat(const hacktracker::scoring::v1::UpdateAtBatRequest& request,
                           ApiCallback<hacktracker::scoring::v1::AtBat>         done) = 0;

  virtual void DeleteAtBat(const std::string& game_id, const std::string& at_bat_id, ApiCallback<Ack> done) = 0;

  virtual void ListGames(const std::string& team_id, ApiCallback<hacktracker::scoring::v1::GameList> done) = 0;

  virtual void UpdateGameLineup(const std::string& game_id, const std::vector<hacktracker::scoring::v1::LineupSlot>& lineup,
                                ApiCallback<hacktracker::scoring::v1::Game> done) = 0;
};

} // namespace hacktracker::api
