#pragma once

#include <string_view>

namespace booksync {

/// Install the process-wide async spdlog logger
/// Unknown level names fall back to info
/// @param to_stderr Log to stderr, keeping stdout for JSON output
void setup_logging(std::string_view level, bool to_stderr = false);

}  // namespace booksync
