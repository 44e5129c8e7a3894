/**
 * Windows-specific implementations for desktop integration
 */

#include "platform.hpp"

#ifdef _WIN32

#include <windows.h>

#include <spdlog/spdlog.h>

#include <string>
#include <system_error>
#include <utility>

namespace twice {

namespace {

std::wstring widen(const std::string& text) {
  if (text.empty()) {
    return {};
  }

  int size_needed = MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, nullptr, 0);
  if (size_needed <= 0) {
    return {};
  }

  std::wstring wtext(size_needed - 1, 0);
  MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, &wtext[0], size_needed);
  return wtext;
}

std::string last_error() {
  return std::system_category().message(static_cast<int>(GetLastError()));
}

} // namespace

// ============================================================================
// File Manager Implementation (Windows Explorer)
// ============================================================================

bool reveal_supported() {
  return true;
}

result<void> reveal_in_file_manager(const std::string& path) {
  // The comma belongs to the switch: explorer expects "/select,<path>"
  std::wstring command_line = L"explorer /select,\"" + widen(path) + L"\"";

  STARTUPINFOW startup_info{};
  startup_info.cb = sizeof(startup_info);
  PROCESS_INFORMATION process_info{};

  if (!CreateProcessW(nullptr, command_line.data(), nullptr, nullptr, FALSE, 0, nullptr,
                      nullptr, &startup_info, &process_info)) {
    auto err = error::launch_failure(last_error());
    spdlog::warn(err.message());
    return std::unexpected{std::move(err)};
  }

  // Explorer outlives the request, only our handles are released
  CloseHandle(process_info.hThread);
  CloseHandle(process_info.hProcess);

  spdlog::debug("revealed {} in explorer", path);
  return {};
}

} // namespace twice

#endif // _WIN32
