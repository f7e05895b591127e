#include "errors.hpp"

namespace hacktracker::util {

std::string Describe(const TransportError& e) {
  std::string out = "TransportError(" + std::to_string(e.StatusCode()) + "): " + e.what();
  if (!e.ErrorType().empty()) {
    out += " (" + e.ErrorType() + ")";
  }
  return out;
}

} // namespace hacktracker::util
