/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace skymatch::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{
    std::mutex s_init_mutex;

    void init_locked(const LoggerConfig& config,
                     std::shared_ptr<spdlog::logger>& core_logger,
                     std::shared_ptr<spdlog::logger>& app_logger)
    {
        // -----------------------------------------------------------------
        // Shared sinks: both loggers write to the same console and file
        // -----------------------------------------------------------------
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        if (!config.log_file.empty())
        {
            // Rotating file sink: 5 MB max size, 3 rotated files
            constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
            constexpr std::size_t kMaxFiles = 3;
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file, kMaxFileSize, kMaxFiles);
            file_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
            sinks.push_back(file_sink);
        }

        // Re-initialization replaces previously registered loggers
        spdlog::drop("SKYMATCH");
        spdlog::drop("APP");

        core_logger = std::make_shared<spdlog::logger>("SKYMATCH", sinks.begin(), sinks.end());
        core_logger->set_level(config.level);
        core_logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(core_logger);

        app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
        app_logger->set_level(config.level);
        app_logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(app_logger);
    }
}

void Logger::init(const LoggerConfig& config)
{
    const std::lock_guard<std::mutex> lock(s_init_mutex);
    init_locked(config, s_core_logger, s_app_logger);
}

void Logger::shutdown()
{
    const std::lock_guard<std::mutex> lock(s_init_mutex);
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
}

std::shared_ptr<spdlog::logger> Logger::get_core_logger()
{
    const std::lock_guard<std::mutex> lock(s_init_mutex);
    if (!s_core_logger)
    {
        init_locked({}, s_core_logger, s_app_logger);
    }
    return s_core_logger;
}

std::shared_ptr<spdlog::logger> Logger::get_app_logger()
{
    const std::lock_guard<std::mutex> lock(s_init_mutex);
    if (!s_app_logger)
    {
        init_locked({}, s_core_logger, s_app_logger);
    }
    return s_app_logger;
}

} // namespace skymatch::core
