#include "commands.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <memory>
#include <system_error>
#include <utility>

namespace
{
    struct file_closer
    {
        void operator()(std::FILE *file) const
        {
            std::fclose(file);
        }
    };

    using file_ptr = std::unique_ptr<std::FILE, file_closer>;

    std::string os_error(int code)
    {
        return std::error_code{code, std::generic_category()}.message();
    }

    file_ptr open(const std::string &path, const char *mode)
    {
        errno = 0;
        return file_ptr{std::fopen(path.c_str(), mode)};
    }
} // namespace

namespace twice
{
    result<std::vector<std::uint8_t>> read_file(const std::string &path)
    {
        auto file = open(path, "rb");

        if (!file)
        {
            auto err = error::read_failure(path, os_error(errno ? errno : ENOENT));
            spdlog::warn(err.message());
            return std::unexpected{std::move(err)};
        }

        std::vector<std::uint8_t> rtn;
        std::array<std::uint8_t, 64 * 1024> chunk{};

        while (true)
        {
            const auto count = std::fread(chunk.data(), 1, chunk.size(), file.get());
            rtn.insert(rtn.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(count));

            if (count == chunk.size())
            {
                continue;
            }

            if (std::ferror(file.get()))
            {
                auto err = error::read_failure(path, os_error(errno ? errno : EIO));
                spdlog::warn(err.message());
                return std::unexpected{std::move(err)};
            }

            break;
        }

        spdlog::debug("read {} byte(s) from {}", rtn.size(), path);
        return rtn;
    }

    result<void> write_file(const std::string &path, std::span<const std::uint8_t> data)
    {
        auto file = open(path, "wb");

        if (!file)
        {
            auto err = error::write_failure(path, os_error(errno ? errno : EACCES));
            spdlog::warn(err.message());
            return std::unexpected{std::move(err)};
        }

        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), file.get()) != data.size())
        {
            auto err = error::write_failure(path, os_error(errno ? errno : EIO));
            spdlog::warn(err.message());
            return std::unexpected{std::move(err)};
        }

        // Buffered data is flushed on close, so ENOSPC and friends may only show up here.
        errno = 0;

        if (std::fclose(file.release()) != 0)
        {
            auto err = error::write_failure(path, os_error(errno ? errno : EIO));
            spdlog::warn(err.message());
            return std::unexpected{std::move(err)};
        }

        spdlog::debug("wrote {} byte(s) to {}", data.size(), path);
        return {};
    }
} // namespace twice
