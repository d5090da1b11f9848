// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <optional>
#include <source_location>
#include <string>

namespace MDG {

/**
 * @brief Log level enumeration
 *
 * Matches common logging frameworks (spdlog, glog, etc.)
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Parse a level name as accepted by MDG_LOG_LEVEL and `mdg_cli --log-level`
 *
 * Case-insensitive; "warning" and "err" are accepted as aliases.
 */
std::optional<LogLevel> parseLogLevel(const std::string &name);

const char *logLevelToString(LogLevel level);

/**
 * @brief Logger backend interface for dependency injection
 *
 * Hosts embedding MDG (editors, language servers) implement this interface to
 * route extraction and patching diagnostics into their own logging system.
 *
 * Example: forwarding to a host log channel
 * @code
 * class HostChannelLogger : public MDG::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message,
 *              const std::source_location &loc) override {
 *         channel_->append(level, message, loc.file_name(), loc.line());
 *     }
 *
 *     void setLevel(LogLevel level) override {
 *         channel_->setMinLevel(level);
 *     }
 *
 *     void flush() override {
 *         channel_->flush();
 *     }
 * };
 *
 * // Before the first MachineProject is created:
 * MDG::Logger::setBackend(std::make_unique<HostChannelLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Formatted message, prefixed with the emitting component
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level
     *
     * Logger filters before formatting; the backend only sees messages at or
     * above the level it was last given.
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace MDG
