// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "backends/SpdlogBackend.h"
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace MDG {

namespace {

constexpr const char *LOGGER_NAME = "mdg";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v";

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    // A second backend instance (tests, re-initialization) reuses the registered logger
    logger_ = spdlog::get(LOGGER_NAME);
    if (logger_) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(consoleSink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "mdg.log";
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        fileSink->set_pattern(FILE_PATTERN);
        sinks.push_back(fileSink);
    }

    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger_->set_level(spdlog::level::warn);
    spdlog::register_logger(logger_);
}

void SpdlogBackend::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    spdlog::source_loc source{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
    logger_->log(source, convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::warn;
}

}  // namespace MDG
