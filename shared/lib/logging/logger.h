/**
 * @file logger.h
 * @brief spdlog setup shared by the service and its tools
 *
 * @date 2026-10-18
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <string>
#include <memory>
#include <vector>

namespace nisab::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Map a textual level to spdlog's enum
     * @param level trace, debug, info, warn, error, critical (unknown -> info)
     */
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "warn" || level == "warning") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    /**
     * @brief Install the default logger for a service
     * @param serviceName Logger name shown in every line (e.g., "nisab-hawl")
     * @param logLevel Log level name
     * @param logToFile Also write to a rotating file
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& serviceName,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(serviceName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::info("Logger initialized: service={}, level={}, file={}",
                         serviceName, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Change the level of the default logger at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::info("Log level changed to: {}", level);
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace nisab::common
