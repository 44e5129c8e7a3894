#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "../src/commands.hpp"

namespace fs = std::filesystem;

using twice::error_kind;
using twice::read_file;
using twice::write_file;

namespace
{
    class FileCommandsTest : public ::testing::Test
    {
      protected:
        fs::path dir;

        void SetUp() override
        {
            dir = fs::temp_directory_path() /
                  (std::string{"twice_commands_"} + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::create_directories(dir);
        }

        void TearDown() override
        {
            std::error_code ec;
            fs::remove_all(dir, ec);
        }
    };
} // namespace

TEST_F(FileCommandsTest, WriteThenReadReturnsSameBytes)
{
    const auto path = (dir / "out.pdf").string();
    const std::vector<std::uint8_t> bytes{0x25, 0x50, 0x44, 0x46};

    ASSERT_TRUE(write_file(path, bytes).has_value());

    auto contents = read_file(path);
    ASSERT_TRUE(contents.has_value()) << contents.error().message();
    EXPECT_EQ(contents.value(), bytes);
}

TEST_F(FileCommandsTest, EmptyPayloadRoundTrips)
{
    const auto path = (dir / "empty.pdf").string();

    ASSERT_TRUE(write_file(path, {}).has_value());
    EXPECT_TRUE(fs::exists(path));

    auto contents = read_file(path);
    ASSERT_TRUE(contents.has_value());
    EXPECT_TRUE(contents->empty());
}

TEST_F(FileCommandsTest, LargeBinaryPayloadRoundTrips)
{
    const auto path = (dir / "large.pdf").string();

    std::vector<std::uint8_t> bytes(300 * 1024 + 17);
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        bytes[i] = static_cast<std::uint8_t>((i * 31) ^ (i >> 8));
    }

    ASSERT_TRUE(write_file(path, bytes).has_value());

    auto contents = read_file(path);
    ASSERT_TRUE(contents.has_value());
    EXPECT_EQ(contents.value(), bytes);
}

TEST_F(FileCommandsTest, WriteTruncatesExistingFile)
{
    const auto path = (dir / "doc.pdf").string();

    ASSERT_TRUE(write_file(path, std::vector<std::uint8_t>(64, 0xAA)).has_value());
    ASSERT_TRUE(write_file(path, std::vector<std::uint8_t>{0x01, 0x02}).has_value());

    auto contents = read_file(path);
    ASSERT_TRUE(contents.has_value());
    EXPECT_EQ(contents.value(), (std::vector<std::uint8_t>{0x01, 0x02}));
}

TEST_F(FileCommandsTest, ReadMissingFileFails)
{
    const auto path = (dir / "nope.pdf").string();

    auto contents = read_file(path);

    ASSERT_FALSE(contents.has_value());
    EXPECT_EQ(contents.error().kind(), error_kind::read_failure);
    EXPECT_NE(contents.error().message().find(path), std::string::npos);
    EXPECT_EQ(contents.error().message().rfind("Failed to read file ", 0), 0u);
}

TEST_F(FileCommandsTest, ReadDirectoryFails)
{
    auto contents = read_file(dir.string());

    ASSERT_FALSE(contents.has_value());
    EXPECT_EQ(contents.error().kind(), error_kind::read_failure);
}

TEST_F(FileCommandsTest, WriteIntoMissingDirectoryFails)
{
    const auto path = (dir / "missing" / "out.pdf").string();

    auto written = write_file(path, std::vector<std::uint8_t>{0x25});

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind(), error_kind::write_failure);
    EXPECT_NE(written.error().message().find(path), std::string::npos);
    EXPECT_FALSE(fs::exists(path));
}

TEST(ErrorKind, Names)
{
    EXPECT_EQ(twice::to_string(error_kind::read_failure), "read_failure");
    EXPECT_EQ(twice::to_string(error_kind::fatal_startup), "fatal_startup");
    EXPECT_EQ(twice::error::unsupported_platform().message(), "Not supported on this OS");
}
