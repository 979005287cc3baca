#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core library + application loggers).

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace planisphere::core
{
    /// @brief Centralized logging facility for Planisphere.
    ///
    /// Provides two separate loggers:
    /// - **PLANISPHERE** (core): observer validation, catalog loading
    /// - **APP**: the demo executable and other front ends
    ///
    /// Both write to colored console output and, unless the library is
    /// embedded with an empty log path, to a shared rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers.
        /// Must be called once at startup before any PLN_ macros are used.
        /// @param log_file Rotating log file; an empty path logs to the console only.
        static void init(const std::filesystem::path& log_file = "planisphere.log");

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the library logger ("PLANISPHERE").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace planisphere::core

// -----------------------------------------------------------------
// Core library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define PLN_CORE_TRACE(...)    ::planisphere::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define PLN_CORE_INFO(...)     ::planisphere::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define PLN_CORE_WARN(...)     ::planisphere::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define PLN_CORE_ERROR(...)    ::planisphere::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define PLN_CORE_CRITICAL(...) ::planisphere::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define PLN_TRACE(...)         ::planisphere::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define PLN_INFO(...)          ::planisphere::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define PLN_WARN(...)          ::planisphere::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define PLN_ERROR(...)         ::planisphere::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define PLN_CRITICAL(...)      ::planisphere::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
