#pragma once

#include "error.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace twice
{
    result<std::vector<std::uint8_t>> read_file(const std::string &path);

    /**
     * @brief Creates or truncates @param path and writes @param data into it.
     * @note A failure part way through may leave the file truncated or partially written.
     */
    result<void> write_file(const std::string &path, std::span<const std::uint8_t> data);
} // namespace twice
