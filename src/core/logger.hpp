#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace astrochart::core
{
    /// @brief Centralized logging facility for astrochart.
    ///
    /// Provides two separate loggers:
    /// - **ASTROCHART** (core): ephemeris provider, chart pipeline, validation
    /// - **APP**: command-line front end, user-facing messages
    ///
    /// Both write to colored stderr output (stdout is reserved for chart JSON)
    /// and, when configured, to a rotating log file.
    /// Call init() once from main() before any logging. Until then, and after
    /// shutdown(), the accessors hand out a stderr fallback logger at warn level
    /// so that hosts embedding the core without init() still log safely.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with a stderr sink and an optional file sink.
        /// Must be called once at startup before any ACH_ macros are used.
        static void init(const LoggingConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("ASTROCHART"). Never null.
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP"). Never null.
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace astrochart::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ACH_CORE_TRACE(...)    ::astrochart::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ACH_CORE_DEBUG(...)    ::astrochart::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define ACH_CORE_INFO(...)     ::astrochart::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ACH_CORE_WARN(...)     ::astrochart::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ACH_CORE_ERROR(...)    ::astrochart::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ACH_CORE_CRITICAL(...) ::astrochart::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ACH_TRACE(...)         ::astrochart::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ACH_DEBUG(...)         ::astrochart::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define ACH_INFO(...)          ::astrochart::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ACH_WARN(...)          ::astrochart::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ACH_ERROR(...)         ::astrochart::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define ACH_CRITICAL(...)      ::astrochart::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
