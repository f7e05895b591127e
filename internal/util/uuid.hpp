#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace hacktracker::util {

/*
  UUID helpers

  Used for client-side temporary record ids ("temp-<uuid>") that live in a
  collection until the server assigns the real id.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string TempId();
bool        IsTempId(const std::string& id);

} // namespace hacktracker::util
