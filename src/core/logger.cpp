/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with stderr + optional rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>
#include <vector>

namespace astrochart::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{

// Unregistered, so spdlog::drop_all() and spdlog::shutdown() leave it intact
std::shared_ptr<spdlog::logger>& fallback_logger()
{
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        auto fallback = std::make_shared<spdlog::logger>("ASTROCHART", std::move(sink));
        fallback->set_level(spdlog::level::warn);
        return fallback;
    }();
    return logger;
}

} // namespace

void Logger::init(const LoggingConfig& config)
{
    // Re-init replaces the previous loggers (registry names must stay unique)
    if (s_core_logger || s_app_logger)
    {
        shutdown();
    }

    // -----------------------------------------------------------------
    // Shared sinks, both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if (!config.file.empty())
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file.string(), kMaxFileSize, kMaxFiles);
        file_sink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(file_sink);
    }

    const auto level = spdlog::level::from_str(config.level);

    // -----------------------------------------------------------------
    // Core logger ("ASTROCHART"): engine internals
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("ASTROCHART", sinks.begin(), sinks.end());
    s_core_logger->set_level(level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): command-line front end
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(level);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger ? s_core_logger : fallback_logger();
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger ? s_app_logger : fallback_logger();
}

} // namespace astrochart::core
