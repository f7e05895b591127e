#include "messenger.hpp"

#include "internal/observability/logging.hpp"

namespace hacktracker::notify {

void LoggingMessenger::ShowSuccess(const std::string& message) {
  HACKTRACKER_LOG_INFO("user notice", {observability::StringField("message", message)});
}

void LoggingMessenger::ShowError(const std::string& message) {
  HACKTRACKER_LOG_WARN("user error", {observability::StringField("message", message)});
}

} // namespace hacktracker::notify
