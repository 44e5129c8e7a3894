#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace twice
{
    result<void> attach_logger(spdlog::level::level_enum level)
    {
        const std::string name{logger_name};

        if (spdlog::get(name))
        {
            return std::unexpected{error::fatal_startup("logger already attached")};
        }

        std::shared_ptr<spdlog::logger> logger;

        try
        {
            logger = spdlog::stdout_color_mt(name);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            return std::unexpected{error::fatal_startup(ex.what())};
        }

        logger->set_level(level);
        spdlog::set_default_logger(std::move(logger));

        return {};
    }

    void quiet_logger()
    {
        spdlog::set_level(spdlog::level::warn);
    }
} // namespace twice
