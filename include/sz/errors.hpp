#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sz {

class EngineError : public std::runtime_error {
public:
  EngineError(std::string code, const std::string& message, bool retriable)
      : std::runtime_error(message), code_(std::move(code)), retriable_(retriable) {}

  const std::string& code() const noexcept { return code_; }
  bool retriable() const noexcept { return retriable_; }

private:
  std::string code_;
  bool retriable_;
};

// Event names an item outside the queue or a superseded cursor position.
class InvalidEvent : public EngineError {
public:
  explicit InvalidEvent(const std::string& message)
      : EngineError("invalid_event", message, false) {}
};

class SessionNotFound : public EngineError {
public:
  explicit SessionNotFound(const std::string& session_id)
      : EngineError("session_not_found", "Unknown session id: " + session_id, false) {}
  SessionNotFound(const std::string& session_id, const std::string& reason)
      : EngineError("session_not_found", reason + ": " + session_id, false) {}
};

class SessionPaused : public EngineError {
public:
  explicit SessionPaused(const std::string& session_id)
      : EngineError("session_paused", "Session is paused: " + session_id, true) {}
};

class StoreUnavailable : public EngineError {
public:
  explicit StoreUnavailable(const std::string& message)
      : EngineError("store_unavailable", message, true) {}
};

class ContentServiceUnavailable : public EngineError {
public:
  explicit ContentServiceUnavailable(const std::string& message)
      : EngineError("content_unavailable", message, true) {}
};

class ConfigError : public EngineError {
public:
  explicit ConfigError(const std::string& message)
      : EngineError("config_error", message, false) {}
};

} // namespace sz
