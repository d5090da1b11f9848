// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "common/Logger.h"

#ifdef MDG_USE_SPDLOG
#include "backends/SpdlogBackend.h"
#else
#include "backends/DefaultBackend.h"
#endif

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <mutex>

namespace MDG {

namespace {

std::mutex backendMutex;

LogLevel levelFromEnvironment() {
    const char *value = std::getenv("MDG_LOG_LEVEL");
    if (!value) {
        return LogLevel::Warn;
    }
    return parseLogLevel(value).value_or(LogLevel::Warn);
}

}  // namespace

std::optional<LogLevel> parseLogLevel(const std::string &name) {
    static const std::map<std::string, LogLevel> levels = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},    {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},   {"warning", LogLevel::Warn},   {"err", LogLevel::Error},
        {"error", LogLevel::Error}, {"critical", LogLevel::Critical}, {"off", LogLevel::Off},
    };
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = levels.find(lower);
    if (it == levels.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char *logLevelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    }
    return "unknown";
}

std::unique_ptr<ILoggerBackend> Logger::backend_;
std::atomic<LogLevel> Logger::level_{levelFromEnvironment()};

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::move(backend);
    if (backend_) {
        backend_->setLevel(level_.load());
    }
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
#ifdef MDG_USE_SPDLOG
        backend_ = std::make_unique<SpdlogBackend>();
#else
        backend_ = std::make_unique<DefaultBackend>();
#endif
        backend_->setLevel(level_.load());
    }
}

void Logger::initialize([[maybe_unused]] const std::string &logDir, [[maybe_unused]] bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
#ifdef MDG_USE_SPDLOG
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
        // DefaultBackend has no file output
        backend_ = std::make_unique<DefaultBackend>();
#endif
        backend_->setLevel(level_.load());
    }
}

void Logger::setLevel(LogLevel level) {
    level_.store(level);
    ensureBackend();
    backend_->setLevel(level);
}

LogLevel Logger::getLevel() {
    return level_.load();
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    if (!isEnabled(level)) {
        return;
    }
    ensureBackend();
    backend_->log(level, message, loc);
}

}  // namespace MDG
