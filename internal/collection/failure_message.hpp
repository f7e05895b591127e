#pragma once

#include <exception>
#include <string>

#include "internal/util/errors.hpp"

namespace hacktracker::collection {

/*
  Toast text for a failed mutation, "<prefix>: <reason>". Transport
  failures are named by status class; a 400 carries the server's own
  message since it explains what was rejected.
*/
inline std::string FailureMessage(const std::string& prefix, const std::exception& e) {
  const auto* transport = dynamic_cast<const util::TransportError*>(&e);
  if (transport == nullptr) return prefix + ": " + e.what();

  if (transport->IsNetworkFailure()) return prefix + ": Network error";
  if (transport->IsUnauthorized() || transport->IsForbidden()) return prefix + ": Not authorized";
  if (transport->IsNotFound()) return prefix + ": Not found";
  if (transport->IsValidationFailure()) return prefix + ": " + transport->what();
  if (transport->IsServerError()) return prefix + ": Server error";
  return prefix + ": " + util::Describe(*transport);
}

// what() of the exception held by an ApiResult failure.
inline std::string ErrorText(const std::exception_ptr& error) {
  if (!error) return "unknown error";

  try {
    std::rethrow_exception(error);
  } catch (const util::TransportError& e) {
    return util::Describe(e);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

} // namespace hacktracker::collection
