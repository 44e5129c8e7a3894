#include "error.hpp"

#include <fmt/format.h>

#include <utility>

namespace twice
{
    error::error(error_kind kind, std::string message) : m_kind(kind), m_message(std::move(message)) {}

    error_kind error::kind() const
    {
        return m_kind;
    }

    const std::string &error::message() const
    {
        return m_message;
    }

    error error::read_failure(std::string_view path, std::string_view reason)
    {
        return {error_kind::read_failure, fmt::format("Failed to read file {}: {}", path, reason)};
    }

    error error::write_failure(std::string_view path, std::string_view reason)
    {
        return {error_kind::write_failure, fmt::format("Failed to write file {}: {}", path, reason)};
    }

    error error::unsupported_platform()
    {
        return {error_kind::unsupported_platform, "Not supported on this OS"};
    }

    error error::launch_failure(std::string_view reason)
    {
        return {error_kind::launch_failure, fmt::format("Failed to open explorer: {}", reason)};
    }

    error error::fatal_startup(std::string_view reason)
    {
        return {error_kind::fatal_startup, fmt::format("Failed to start application: {}", reason)};
    }

    std::string_view to_string(error_kind kind)
    {
        switch (kind)
        {
        case error_kind::read_failure:
            return "read_failure";
        case error_kind::write_failure:
            return "write_failure";
        case error_kind::unsupported_platform:
            return "unsupported_platform";
        case error_kind::launch_failure:
            return "launch_failure";
        case error_kind::fatal_startup:
            return "fatal_startup";
        }

        return "unknown";
    }
} // namespace twice
