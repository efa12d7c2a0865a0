#pragma once

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace sz::log {

inline bool env_flag(const char* name) {
  const char* env = std::getenv(name);
  if (!env) {
    return false;
  }
  std::string value(env);
  return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
}

// SZ_DEBUG enables every channel, SZ_DEBUG_<CHANNEL> a single one.
inline bool debug_enabled(const std::string& channel) {
  if (env_flag("SZ_DEBUG")) {
    return true;
  }
  std::string name = "SZ_DEBUG_";
  for (char ch : channel) {
    name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
  }
  return env_flag(name.c_str());
}

inline std::mutex& stderr_mutex() {
  static std::mutex mutex;
  return mutex;
}

inline void debug(const std::string& channel, const std::string& message) {
  if (debug_enabled(channel)) {
    std::lock_guard<std::mutex> lock(stderr_mutex());
    std::cerr << "[" << channel << "] " << message << std::endl;
  }
}

inline void warn(const std::string& channel, const std::string& message) {
  std::lock_guard<std::mutex> lock(stderr_mutex());
  std::cerr << "[" << channel << "] warning: " << message << std::endl;
}

} // namespace sz::log
