#pragma once

#include "error.hpp"

#include <spdlog/common.h>

#include <string_view>

namespace twice
{
    inline constexpr std::string_view logger_name = "twice";

    /**
     * @brief Registers the "twice" console logger at @param level and makes it the default logger.
     * @note Fails if the logger has already been attached.
     */
    result<void> attach_logger(spdlog::level::level_enum level);

    /**
     * @brief Limits the default logger to warnings, used when no logger gets attached.
     */
    void quiet_logger();
} // namespace twice
