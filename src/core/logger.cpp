/// @file logger.cpp
/// @brief Dual spdlog loggers sharing console and rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

namespace vedika::core
{

namespace
{
    /// Stand-in before init() and after shutdown(): discards everything.
    std::shared_ptr<spdlog::logger>& null_logger()
    {
        static std::shared_ptr<spdlog::logger> logger = [] {
            auto l = std::make_shared<spdlog::logger>("NULL", std::make_shared<spdlog::sinks::null_sink_mt>());
            l->set_level(spdlog::level::off);
            return l;
        }();
        return logger;
    }
}

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(std::string_view level)
{
    // -----------------------------------------------------------------
    // Shared sinks, both loggers write to the same console and file
    // -----------------------------------------------------------------

    // Console goes to stderr so digest text on stdout stays clean
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");

    // Rotating file sink: 5 MB max size, 3 rotated files
    constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
    constexpr std::size_t kMaxFiles = 3;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "vedika.log", kMaxFileSize, kMaxFiles);
    file_sink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");

    install({console_sink, file_sink}, spdlog::level::from_str(std::string(level)));
}

void Logger::init_silent()
{
    install({std::make_shared<spdlog::sinks::null_sink_mt>()}, spdlog::level::off);
}

void Logger::set_level(std::string_view level)
{
    const auto parsed = spdlog::level::from_str(std::string(level));
    if (s_core_logger)
    {
        s_core_logger->set_level(parsed);
    }
    if (s_app_logger)
    {
        s_app_logger->set_level(parsed);
    }
}

void Logger::install(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level)
{
    // Re-initialization replaces the previously registered loggers
    spdlog::drop("VEDIKA");
    spdlog::drop("APP");

    // -----------------------------------------------------------------
    // Core logger ("VEDIKA"): ephemeris, loaders, configuration
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("VEDIKA", sinks.begin(), sinks.end());
    s_core_logger->set_level(level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): digest, command line
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
    return s_core_logger ? s_core_logger : null_logger();
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger ? s_app_logger : null_logger();
}

} // namespace vedika::core
