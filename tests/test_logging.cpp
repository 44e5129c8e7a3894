#include <gtest/gtest.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

#include "../src/logging.hpp"

namespace
{
    class LoggerTest : public ::testing::Test
    {
      protected:
        void TearDown() override
        {
            // Replacing the default logger also unregisters "twice"
            spdlog::set_default_logger(
                std::make_shared<spdlog::logger>("", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
            spdlog::drop(std::string{twice::logger_name});
        }
    };
} // namespace

TEST_F(LoggerTest, AttachSetsDefaultLogger)
{
    ASSERT_TRUE(twice::attach_logger(spdlog::level::info).has_value());

    auto logger = spdlog::get(std::string{twice::logger_name});
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(spdlog::default_logger(), logger);
    EXPECT_EQ(logger->level(), spdlog::level::info);
}

TEST_F(LoggerTest, SecondAttachIsFatal)
{
    ASSERT_TRUE(twice::attach_logger(spdlog::level::info).has_value());

    auto again = twice::attach_logger(spdlog::level::debug);

    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().kind(), twice::error_kind::fatal_startup);
    EXPECT_EQ(spdlog::get(std::string{twice::logger_name})->level(), spdlog::level::info);
}

TEST_F(LoggerTest, QuietLimitsToWarnings)
{
    twice::quiet_logger();
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);

    spdlog::set_level(spdlog::level::info);
}
