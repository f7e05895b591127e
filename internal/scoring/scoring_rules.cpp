#include "scoring_rules.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace hacktracker::scoring {

namespace {

constexpr std::array<std::string_view, 23> kSingleOutCodes = {
    "K",                          // strikeout
    "OUT",                        // generic
    "FO",  "GO",  "PO",  "LO",    // fly / ground / pop / line out
    "F7",  "F8",  "F9",           // fly out to LF / CF / RF
    "L7",  "L8",  "L9",           // line out to LF / CF / RF
    "P3",  "P4",  "P5",  "P6",    // pop out to 1B / 2B / 3B / SS
    "G3",  "G4",  "G5",  "G6",    // ground out to 1B / 2B / 3B / SS
    "SF",  "SH",  "SAC",          // sacrifices count against the batter
};

constexpr std::array<std::string_view, 9> kHitCodes = {
    "1B", "2B", "3B", "HR", "SINGLE", "DOUBLE", "TRIPLE", "HOMERUN", "HOME_RUN",
};

constexpr std::array<std::string_view, 3> kWalkCodes = {"BB", "BASE_ON_BALLS", "WALK"};

constexpr std::array<std::string_view, 2> kHitByPitchCodes = {"HBP", "HIT_BY_PITCH"};

constexpr std::array<std::string_view, 4> kReachedOnErrorCodes = {"E", "ERROR", "FC", "FIELDERS_CHOICE"};

template <std::size_t N>
bool Contains(const std::array<std::string_view, N>& codes, std::string_view normalized) {
  return std::find(codes.begin(), codes.end(), normalized) != codes.end();
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

bool IsTriplePlay(std::string_view normalized) {
  return StartsWith(normalized, "TP") || normalized == "TRIPLE_PLAY";
}

bool IsDoublePlay(std::string_view normalized) {
  return StartsWith(normalized, "DP") || normalized == "DOUBLE_PLAY";
}

} // namespace

std::string Normalize(std::string_view code) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

  auto begin = code.begin();
  auto end   = code.end();
  while (begin != end && is_space(*begin)) ++begin;
  while (end != begin && is_space(*(end - 1))) --end;

  std::string out(begin, end);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

bool IsOut(std::string_view code) {
  const auto normalized = Normalize(code);
  return Contains(kSingleOutCodes, normalized) || IsDoublePlay(normalized) || IsTriplePlay(normalized);
}

int OutCount(std::string_view code) {
  const auto normalized = Normalize(code);

  if (IsTriplePlay(normalized)) return 3;
  if (IsDoublePlay(normalized)) return 2;
  if (Contains(kSingleOutCodes, normalized)) return 1;
  return 0;
}

bool IsHit(std::string_view code) {
  return Contains(kHitCodes, Normalize(code));
}

bool IsWalk(std::string_view code) {
  return Contains(kWalkCodes, Normalize(code));
}

bool IsHitByPitch(std::string_view code) {
  return Contains(kHitByPitchCodes, Normalize(code));
}

bool ReachesBase(std::string_view code) {
  const auto normalized = Normalize(code);
  return Contains(kHitCodes, normalized) || Contains(kWalkCodes, normalized) || Contains(kHitByPitchCodes, normalized) ||
         Contains(kReachedOnErrorCodes, normalized);
}

ResultClass Classify(std::string_view code) {
  const auto normalized = Normalize(code);

  if (IsOut(normalized)) return ResultClass::kOut;
  if (Contains(kHitCodes, normalized)) return ResultClass::kHit;
  if (Contains(kWalkCodes, normalized)) return ResultClass::kWalk;
  if (Contains(kHitByPitchCodes, normalized)) return ResultClass::kHitByPitch;
  if (Contains(kReachedOnErrorCodes, normalized)) return ResultClass::kReachedOnError;
  return ResultClass::kUnknown;
}

const char* ToString(ResultClass result_class) {
  switch (result_class) {
    case ResultClass::kOut:
      return "out";
    case ResultClass::kHit:
      return "hit";
    case ResultClass::kWalk:
      return "walk";
    case ResultClass::kHitByPitch:
      return "hit_by_pitch";
    case ResultClass::kReachedOnError:
      return "reached_on_error";
    case ResultClass::kUnknown:
    default:
      return "unknown";
  }
}

} // namespace hacktracker::scoring
