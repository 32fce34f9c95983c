#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library + application loggers).

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace almanac::core
{
    /// @brief Logger setup. All fields have working defaults.
    struct LoggerConfig
    {
        spdlog::level::level_enum level = spdlog::level::info;
        bool console = true;           ///< Colored stdout sink
        std::string log_file;          ///< Rotating file sink; empty disables it
        std::size_t max_file_size = 5 * 1024 * 1024;
        std::size_t max_files = 3;
    };

    /// @brief Centralized logging facility for Almanac.
    ///
    /// Provides two separate loggers:
    /// - **ALMANAC** (core): rejected inputs and internal faults raised by the
    ///   formula library
    /// - **APP**: executables and user-facing messages
    ///
    /// Both loggers exist from program start with no sinks attached, so the
    /// library can log before (or without) init() and simply produces no output.
    /// init() and shutdown() are not thread-safe; call them from main().
    class Logger
    {
    public:
        /// @brief Attach console and/or file sinks to both loggers.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush, detach all sinks and unregister from spdlog.
        static void shutdown();

        /// @brief Access the library logger ("ALMANAC").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace almanac::core

// -----------------------------------------------------------------
// Library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ALM_CORE_TRACE(...)    ::almanac::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ALM_CORE_DEBUG(...)    ::almanac::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define ALM_CORE_INFO(...)     ::almanac::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ALM_CORE_WARN(...)     ::almanac::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ALM_CORE_ERROR(...)    ::almanac::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ALM_CORE_CRITICAL(...) ::almanac::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ALM_TRACE(...)         ::almanac::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ALM_INFO(...)          ::almanac::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ALM_WARN(...)          ::almanac::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ALM_ERROR(...)         ::almanac::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define ALM_CRITICAL(...)      ::almanac::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
