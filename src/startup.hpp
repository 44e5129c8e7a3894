#pragma once

#include <atomic>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace twice
{
    /**
     * @brief Returns every argument after the executable path that ends in ".pdf" (any case) and exists on disk.
     * @note Order is preserved.
     */
    std::vector<std::string> scan_pdf_arguments(std::span<const std::string> args);

    /**
     * @brief Write-once list of the PDF paths given on the command line.
     *
     * The first call to `set` wins, later calls are no-ops. Reads after the write never lock.
     */
    class startup_paths
    {
        std::mutex m_write_mutex;
        std::atomic<bool> m_ready{false};
        std::vector<std::string> m_paths;

      public:
        bool set(std::vector<std::string> paths);
        [[nodiscard]] std::vector<std::string> get() const;

      public:
        static startup_paths &global();
    };

    /**
     * @brief Scans @param argv and stores the result in `startup_paths::global()`.
     * @return Whether this call stored the result.
     */
    bool capture_startup_paths(int argc, char **argv);
} // namespace twice
