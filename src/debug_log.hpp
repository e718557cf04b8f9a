#pragma once

#include <string>
#include <string_view>

namespace recall::detail {

// True when RECALL_DEBUG is set to anything but "", "0", "false" or "FALSE".
bool debug_enabled();

// Writes "[recall:<tag>] message" to stderr when debugging is enabled.
void debug_log(std::string_view tag, const std::string& message);

} // namespace recall::detail
