/**
 * Non-Windows implementations for desktop integration
 */

#include "platform.hpp"

#ifndef _WIN32

namespace twice {

// ============================================================================
// File Manager Implementation (unsupported)
// TODO: Reveal via org.freedesktop.FileManager1.ShowItems on Linux and
//       `open -R` on macOS
// ============================================================================

bool reveal_supported() {
  return false;
}

result<void> reveal_in_file_manager(const std::string&) {
  return std::unexpected{error::unsupported_platform()};
}

} // namespace twice

#endif // !_WIN32
