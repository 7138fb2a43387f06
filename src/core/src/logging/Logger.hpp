/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace arm_kinematics {

class Logger {
public:
    /**
     * Initialize the logging system
     * @param log_file Path to log file (empty = console only)
     * @param level Log level (trace, debug, info, warn, error)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     */
    static void init(const std::string& log_file = "logs/arm_kinematics.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5);

    /**
     * Reset to uninitialized so the next init() rebuilds the sinks
     * (used when the logging section of the system config is loaded)
     */
    static void shutdown();

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace arm_kinematics

// Convenience macros
#define LOG_TRACE(...) ::arm_kinematics::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::arm_kinematics::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::arm_kinematics::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::arm_kinematics::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::arm_kinematics::Logger::get()->error(__VA_ARGS__)
