#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>

namespace Hillkeeper {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Owns two loggers: "HILL" for the rules engine and "SIM" for the
 * scenario host and tools. Both share the same sinks.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Get the rules logger
     *
     * Falls back to the spdlog default logger before Initialize().
     */
    static std::shared_ptr<spdlog::logger> GetRulesLogger();

    /**
     * @brief Get the simulation logger
     */
    static std::shared_ptr<spdlog::logger> GetSimLogger();

    [[nodiscard]] static bool IsInitialized() noexcept { return s_initialized; }

private:
    static std::shared_ptr<spdlog::logger> s_rulesLogger;
    static std::shared_ptr<spdlog::logger> s_simLogger;
    static bool s_initialized;
};

} // namespace Hillkeeper

// Convenience macros for rules logging
#define HILLKEEPER_LOG_TRACE(...)    ::Hillkeeper::Logger::GetRulesLogger()->trace(__VA_ARGS__)
#define HILLKEEPER_LOG_DEBUG(...)    ::Hillkeeper::Logger::GetRulesLogger()->debug(__VA_ARGS__)
#define HILLKEEPER_LOG_INFO(...)     ::Hillkeeper::Logger::GetRulesLogger()->info(__VA_ARGS__)
#define HILLKEEPER_LOG_WARN(...)     ::Hillkeeper::Logger::GetRulesLogger()->warn(__VA_ARGS__)
#define HILLKEEPER_LOG_ERROR(...)    ::Hillkeeper::Logger::GetRulesLogger()->error(__VA_ARGS__)
#define HILLKEEPER_LOG_CRITICAL(...) ::Hillkeeper::Logger::GetRulesLogger()->critical(__VA_ARGS__)

// Convenience macros for simulation logging
#define SIM_LOG_TRACE(...)    ::Hillkeeper::Logger::GetSimLogger()->trace(__VA_ARGS__)
#define SIM_LOG_DEBUG(...)    ::Hillkeeper::Logger::GetSimLogger()->debug(__VA_ARGS__)
#define SIM_LOG_INFO(...)     ::Hillkeeper::Logger::GetSimLogger()->info(__VA_ARGS__)
#define SIM_LOG_WARN(...)     ::Hillkeeper::Logger::GetSimLogger()->warn(__VA_ARGS__)
#define SIM_LOG_ERROR(...)    ::Hillkeeper::Logger::GetSimLogger()->error(__VA_ARGS__)
#define SIM_LOG_CRITICAL(...) ::Hillkeeper::Logger::GetSimLogger()->critical(__VA_ARGS__)
