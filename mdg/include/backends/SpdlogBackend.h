// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace MDG {

/**
 * @brief spdlog-based logger backend
 *
 * Used when MDG is built with MDG_USE_SPDLOG=ON (default). Writes to a colored
 * stderr sink and, when a directory is given, to `<logDir>/mdg.log`.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    static spdlog::level::level_enum convertLevel(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace MDG
