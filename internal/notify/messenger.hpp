#pragma once

#include <string>

namespace hacktracker::notify {

/*
  User-facing message surface (toasts). The UI layer implements it; the
  core only reports outcomes through it.
*/
class Messenger {
 public:
  virtual ~Messenger() = default;

  virtual void ShowSuccess(const std::string& message) = 0;
  virtual void ShowError(const std::string& message)   = 0;
};

// Default surface for headless runs: messages go to the log.
class LoggingMessenger final : public Messenger {
 public:
  void ShowSuccess(const std::string& message) override;
  void ShowError(const std::string& message) override;
};

} // namespace hacktracker::notify
