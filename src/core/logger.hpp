#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library core + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace skymatch::core
{
    /// @brief Configuration for logger initialization.
    /// Use designated initializers: Logger::init({.log_file = "skymatch.log"});
    struct LoggerConfig
    {
        std::string log_file;                               ///< Rotating file sink path (empty = console only)
        spdlog::level::level_enum level = spdlog::level::info;
    };

    /// @brief Centralized logging facility for SkyMatch.
    ///
    /// Provides two separate loggers:
    /// - **SKYMATCH** (core): matcher internals, validation failures
    /// - **APP**: demo executable and user-facing messages
    ///
    /// Both write to colored console output and, when configured, a rotating log file.
    /// Call init() once from main() before any logging. If a logger is requested
    /// before init(), a console-only default is created.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console (+ optional file) sinks.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the library-internal logger ("SKYMATCH").
        /// The returned pointer stays valid across a concurrent init() or shutdown().
        [[nodiscard]] static std::shared_ptr<spdlog::logger> get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger> get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace skymatch::core

// -----------------------------------------------------------------
// Core library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SKM_CORE_TRACE(...)    ::skymatch::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SKM_CORE_DEBUG(...)    ::skymatch::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define SKM_CORE_INFO(...)     ::skymatch::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SKM_CORE_WARN(...)     ::skymatch::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SKM_CORE_ERROR(...)    ::skymatch::core::Logger::get_core_logger()->error(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SKM_TRACE(...)         ::skymatch::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SKM_INFO(...)          ::skymatch::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SKM_WARN(...)          ::skymatch::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SKM_ERROR(...)         ::skymatch::core::Logger::get_app_logger()->error(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
