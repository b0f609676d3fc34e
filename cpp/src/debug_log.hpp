#pragma once

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace recall::detail {

inline bool debug_enabled() {
  static bool enabled = [] {
    const char* env = std::getenv("RECALL_DEBUG_SESSION");
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

inline void debug_log(std::string_view channel, const std::string& message) {
  if (debug_enabled()) {
    std::cerr << "[" << channel << "] " << message << std::endl;
  }
}

} // namespace recall::detail
