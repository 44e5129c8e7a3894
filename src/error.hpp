#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace twice
{
    enum class error_kind
    {
        read_failure,
        write_failure,
        unsupported_platform,
        launch_failure,
        fatal_startup,
    };

    class error
    {
        error_kind m_kind;
        std::string m_message;

      public:
        error(error_kind kind, std::string message);

      public:
        [[nodiscard]] error_kind kind() const;
        [[nodiscard]] const std::string &message() const;

      public:
        static error read_failure(std::string_view path, std::string_view reason);
        static error write_failure(std::string_view path, std::string_view reason);
        static error unsupported_platform();
        static error launch_failure(std::string_view reason);
        static error fatal_startup(std::string_view reason);
    };

    template <typename T>
    using result = std::expected<T, error>;

    std::string_view to_string(error_kind kind);
} // namespace twice
