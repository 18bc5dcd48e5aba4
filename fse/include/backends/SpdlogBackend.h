// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace FSE {

/**
 * @brief spdlog-based logger backend
 *
 * Default backend when FSE is built with FSE_USE_SPDLOG=ON.
 * Console output is colored; an optional file sink writes fse.log
 * into the requested directory.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace FSE
