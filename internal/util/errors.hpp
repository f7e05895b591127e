#pragma once

#include <stdexcept>
#include <string>

namespace hacktracker::util {

/*
  Central error types.

  ValidationError and NotFound are raised synchronously. TransportError is
  what a ScoringApi implementation hands to an ApiCallback; mutation code
  turns it into a rollback and a user-facing message.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportError : public std::runtime_error {
 public:
  // status_code 0 means the request never got a response (network failure).
  TransportError(int status_code, const std::string& msg, std::string error_type = {})
      : std::runtime_error(msg), status_code_(status_code), error_type_(std::move(error_type)) {
  }

  int StatusCode() const {
    return status_code_;
  }

  const std::string& ErrorType() const {
    return error_type_;
  }

  bool IsNetworkFailure() const {
    return status_code_ == 0;
  }
  bool IsUnauthorized() const {
    return status_code_ == 401;
  }
  bool IsForbidden() const {
    return status_code_ == 403;
  }
  bool IsNotFound() const {
    return status_code_ == 404;
  }
  bool IsValidationFailure() const {
    return status_code_ == 400;
  }
  bool IsServerError() const {
    return status_code_ >= 500;
  }

 private:
  int         status_code_;
  std::string error_type_;
};

// "TransportError(404): at-bat not found (NotFound)"
std::string Describe(const TransportError& e);

} // namespace hacktracker::util
