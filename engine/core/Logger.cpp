#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace Hillkeeper {

std::shared_ptr<spdlog::logger> Logger::s_rulesLogger;
std::shared_ptr<spdlog::logger> Logger::s_simLogger;
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink on stderr, stdout carries tool output
    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    // File sink
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    s_rulesLogger = std::make_shared<spdlog::logger>("HILL", sinks.begin(), sinks.end());
    s_rulesLogger->set_level(spdlog::level::info);
    s_rulesLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_rulesLogger);

    s_simLogger = std::make_shared<spdlog::logger>("SIM", sinks.begin(), sinks.end());
    s_simLogger->set_level(spdlog::level::info);
    s_simLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_simLogger);

    spdlog::set_default_logger(s_rulesLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_rulesLogger->flush();
    s_simLogger->flush();

    spdlog::drop_all();

    s_rulesLogger.reset();
    s_simLogger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    if (s_rulesLogger) {
        s_rulesLogger->set_level(level);
    }
    if (s_simLogger) {
        s_simLogger->set_level(level);
    }
    if (!s_initialized) {
        spdlog::set_level(level);
    }
}

std::shared_ptr<spdlog::logger> Logger::GetRulesLogger() {
    return s_rulesLogger ? s_rulesLogger : spdlog::default_logger();
}

std::shared_ptr<spdlog::logger> Logger::GetSimLogger() {
    return s_simLogger ? s_simLogger : spdlog::default_logger();
}

} // namespace Hillkeeper
