#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <string>

namespace twice
{
    struct options
    {
        std::string id{"twice"};
        std::string title{"Twice PDF"};

      public:
        std::size_t width{1280};
        std::size_t height{800};

      public:
        /**
         * @brief URL of a dev server or path to the frontend's index.html
         */
        std::string frontend;

      public:
        bool debug{false};
        spdlog::level::level_enum log_level{spdlog::level::info};

      public:
        /**
         * @brief Options for this build: debug follows the build profile, frontend follows TWICE_FRONTEND.
         */
        static options defaults();
    };

    [[nodiscard]] bool is_remote(const std::string &frontend);
} // namespace twice
