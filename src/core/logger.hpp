#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>
#include <vector>

namespace vedika::core
{
    /// @brief Centralized logging facility for Vedika.
    ///
    /// Provides two separate loggers:
    /// - **VEDIKA** (core): ephemeris, loaders, configuration
    /// - **APP**: digest assembly, command line, user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main(). Until then, and after shutdown(), the
    /// accessors hand out a silent logger so the VDK_ macros are always safe.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// @param level spdlog level name ("trace", "debug", "info", ...).
        static void init(std::string_view level = "info");

        /// @brief Initialize both loggers with a null sink.
        /// Used by the test executables so log macros stay valid but quiet.
        static void init_silent();

        /// @brief Change the level of both loggers after init().
        static void set_level(std::string_view level);

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the core logger ("VEDIKA"), never null.
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP"), never null.
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static void install(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level);

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace vedika::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define VDK_CORE_TRACE(...)    ::vedika::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define VDK_CORE_DEBUG(...)    ::vedika::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define VDK_CORE_INFO(...)     ::vedika::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define VDK_CORE_WARN(...)     ::vedika::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define VDK_CORE_ERROR(...)    ::vedika::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define VDK_CORE_CRITICAL(...) ::vedika::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define VDK_TRACE(...)         ::vedika::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define VDK_DEBUG(...)         ::vedika::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define VDK_INFO(...)          ::vedika::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define VDK_WARN(...)          ::vedika::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define VDK_ERROR(...)         ::vedika::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define VDK_CRITICAL(...)      ::vedika::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
