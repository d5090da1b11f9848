// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "common/ILoggerBackend.h"
#include <mutex>

namespace MDG {

/**
 * @brief Minimal stderr logger with no spdlog sinks
 *
 * Used when MDG is built with MDG_USE_SPDLOG=OFF. Level tags are colored only
 * when stderr is a terminal; debug and trace lines carry the emitting source
 * location. No file logging.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    static const char *levelToColor(LogLevel level);
    static std::string getTimestamp();

    LogLevel currentLevel_ = LogLevel::Warn;
    bool colored_;
    std::mutex mutex_;
};

}  // namespace MDG
