#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace hacktracker::api {

// Result type for calls that only acknowledge (delete).
struct Ack {};

/*
  Outcome of one asynchronous API call: a value, or the exception that
  failed it (normally util::TransportError).
*/
template <typename R>
class ApiResult {
 public:
  static ApiResult Ok(R value) {
    ApiResult result;
    result.value_ = std::move(value);
    return result;
  }

  static ApiResult Fail(std::exception_ptr error) {
    ApiResult result;
    result.error_ = error ? std::move(error) : std::make_exception_ptr(std::runtime_error("unknown api failure"));
    return result;
  }

  static ApiResult Fail(const util::TransportError& error) {
    return Fail(std::make_exception_ptr(error));
  }

  bool ok() const {
    return value_.has_value();
  }

  const R& value() const {
    if (!value_) throw std::logic_error("ApiResult holds no value");
    return *value_;
  }

  const std::exception_ptr& error() const {
    return error_;
  }

 private:
  ApiResult() = default;

  std::optional<R>   value_;
  std::exception_ptr error_;
};

// Must be invoked exactly once, on the event loop thread.
template <typename R>
using ApiCallback = std::function<void(ApiResult<R>)>;

} // namespace hacktracker::api
