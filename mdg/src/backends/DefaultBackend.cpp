// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "backends/DefaultBackend.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <spdlog/fmt/fmt.h>
#include <unistd.h>

namespace MDG {

namespace Colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *TRACE = "\033[37m";
constexpr const char *DEBUG = "\033[36m";
constexpr const char *INFO = "\033[32m";
constexpr const char *WARN = "\033[33m";
constexpr const char *ERROR = "\033[31m";
constexpr const char *CRITICAL = "\033[35m";
}  // namespace Colors

DefaultBackend::DefaultBackend() : colored_(::isatty(STDERR_FILENO) != 0) {}

void DefaultBackend::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < currentLevel_ || level == LogLevel::Off) {
        return;
    }

    // [HH:MM:SS.mmm] [level] message (file:line)
    std::string line = "[" + getTimestamp() + "] [";
    if (colored_) {
        line += std::string(levelToColor(level)) + logLevelToString(level) + Colors::RESET;
    } else {
        line += logLevelToString(level);
    }
    line += "] " + message;
    if (level <= LogLevel::Debug) {
        line += fmt::format(" ({}:{})", std::filesystem::path(loc.file_name()).filename().string(), loc.line());
    }
    std::cerr << line << "\n";
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

const char *DefaultBackend::levelToColor(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return Colors::TRACE;
    case LogLevel::Debug:
        return Colors::DEBUG;
    case LogLevel::Info:
        return Colors::INFO;
    case LogLevel::Warn:
        return Colors::WARN;
    case LogLevel::Error:
        return Colors::ERROR;
    case LogLevel::Critical:
        return Colors::CRITICAL;
    default:
        return Colors::RESET;
    }
}

std::string DefaultBackend::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto nowTime = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&nowTime, &tm);
    return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", tm.tm_hour, tm.tm_min, tm.tm_sec,
                       static_cast<int>(millis.count()));
}

}  // namespace MDG
