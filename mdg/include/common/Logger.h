// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "common/ILoggerBackend.h"
#include <atomic>
#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace MDG {

/**
 * @brief Process-wide logging facade
 *
 * Messages go to the built-in backend (SpdlogBackend with MDG_USE_SPDLOG,
 * DefaultBackend otherwise) or to one injected by the host. Both built-in
 * backends write to stderr so that stdout stays free for tool output.
 *
 * The level defaults to Warn and can be overridden through the MDG_LOG_LEVEL
 * environment variable. The LOG_* macros check the level before formatting.
 *
 * @code
 * MDG::Logger::initialize();
 * LOG_INFO("MachineProject: {} machines in {}", count, fileName);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     *
     * Replaces the current backend, which receives the current level.
     *
     * @param backend Logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stderr, no file)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    static bool isEnabled(LogLevel level) {
        return level >= level_.load(std::memory_order_relaxed) && level != LogLevel::Off;
    }

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static std::atomic<LogLevel> level_;

    static void ensureBackend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
};

}  // namespace MDG

#define MDG_LOG_AT(level, method, ...)                                                                                 \
    do {                                                                                                               \
        if (MDG::Logger::isEnabled(level)) {                                                                           \
            MDG::Logger::method(fmt::format(__VA_ARGS__), std::source_location::current());                            \
        }                                                                                                              \
    } while (0)

#define LOG_TRACE(...) MDG_LOG_AT(MDG::LogLevel::Trace, trace, __VA_ARGS__)
#define LOG_DEBUG(...) MDG_LOG_AT(MDG::LogLevel::Debug, debug, __VA_ARGS__)
#define LOG_INFO(...) MDG_LOG_AT(MDG::LogLevel::Info, info, __VA_ARGS__)
#define LOG_WARN(...) MDG_LOG_AT(MDG::LogLevel::Warn, warn, __VA_ARGS__)
#define LOG_ERROR(...) MDG_LOG_AT(MDG::LogLevel::Error, error, __VA_ARGS__)
