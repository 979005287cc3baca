/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers over a shared console sink
///        and an optional rotating file sink.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>
#include <vector>

namespace planisphere::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(const std::filesystem::path& log_file)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console (and file)
    // -----------------------------------------------------------------
    constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if (!log_file.empty())
    {
        // 5 MB per file, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file.string(), kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        sinks.push_back(std::move(file_sink));
    }

    // -----------------------------------------------------------------
    // Core logger ("PLANISPHERE"): library boundaries
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("PLANISPHERE", sinks.begin(), sinks.end());
    s_core_logger->set_level(spdlog::level::trace);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): demo and front ends
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(spdlog::level::trace);
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
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace planisphere::core
