#include "debug_log.hpp"

#include <cstdlib>
#include <iostream>

namespace recall::detail {

bool debug_enabled() {
  static const bool enabled = []() {
    const char* env = std::getenv("RECALL_DEBUG");
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

void debug_log(std::string_view tag, const std::string& message) {
  if (debug_enabled()) {
    std::cerr << "[recall:" << tag << "] " << message << std::endl;
  }
}

} // namespace recall::detail
