/**
 * Platform-specific desktop integration for twice
 *
 * This file provides:
 * - Reveal In File Manager (Windows Explorer)
 */

#pragma once

#include "error.hpp"

#include <string>

namespace twice {

// ============================================================================
// File Manager - Reveal a file with the platform's file manager
// ============================================================================

// Whether reveal_in_file_manager is implemented for the running platform.
bool reveal_supported();

// Launches the file manager with `path` selected. Returns as soon as the
// process is started, it does not wait for the file manager.
result<void> reveal_in_file_manager(const std::string& path);

} // namespace twice
