#include "startup.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace
{
    constexpr std::string_view pdf_extension = ".pdf";

    bool has_pdf_extension(std::string_view arg)
    {
        if (arg.size() < pdf_extension.size())
        {
            return false;
        }

        const auto suffix = arg.substr(arg.size() - pdf_extension.size());

        return std::ranges::equal(suffix, pdf_extension,
                                  [](char lhs, char rhs)
                                  {
                                      return std::tolower(static_cast<unsigned char>(lhs)) == rhs;
                                  });
    }

    bool exists(const std::string &arg)
    {
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::path{arg}, ec);
    }
} // namespace

namespace twice
{
    std::vector<std::string> scan_pdf_arguments(std::span<const std::string> args)
    {
        std::vector<std::string> rtn;

        if (args.empty())
        {
            return rtn;
        }

        for (const auto &arg : args.subspan(1))
        {
            if (!has_pdf_extension(arg) || !exists(arg))
            {
                continue;
            }

            rtn.emplace_back(arg);
        }

        return rtn;
    }

    bool startup_paths::set(std::vector<std::string> paths)
    {
        if (m_ready.load(std::memory_order_acquire))
        {
            return false;
        }

        std::scoped_lock lock(m_write_mutex);

        if (m_ready.load(std::memory_order_relaxed))
        {
            return false;
        }

        m_paths = std::move(paths);
        m_ready.store(true, std::memory_order_release);

        return true;
    }

    std::vector<std::string> startup_paths::get() const
    {
        if (!m_ready.load(std::memory_order_acquire))
        {
            return {};
        }

        return m_paths;
    }

    startup_paths &startup_paths::global()
    {
        static startup_paths instance;
        return instance;
    }

    bool capture_startup_paths(int argc, char **argv)
    {
        std::vector<std::string> args;

        if (argv)
        {
            args.reserve(static_cast<std::size_t>(std::max(argc, 0)));

            for (auto i = 0; argc > i; ++i)
            {
                args.emplace_back(argv[i] ? argv[i] : "");
            }
        }

        auto paths = scan_pdf_arguments(args);
        const auto count = paths.size();

        if (!startup_paths::global().set(std::move(paths)))
        {
            return false;
        }

        spdlog::debug("captured {} pdf path(s) from {} argument(s)", count, args.size());
        return true;
    }
} // namespace twice
