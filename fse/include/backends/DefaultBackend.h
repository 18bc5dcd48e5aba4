// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/ILoggerBackend.h"
#include <chrono>
#include <iostream>
#include <mutex>

namespace FSE {

/**
 * @brief Simple stdout logger with no external dependencies
 *
 * Used when FSE is built without spdlog (FSE_USE_SPDLOG=OFF).
 * Prints "[HH:MM:SS.mmm] [level] message" with ANSI level coloring.
 * No file logging.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    const char *levelToString(LogLevel level);
    const char *levelToColor(LogLevel level);
    std::string getTimestamp();
};

}  // namespace FSE
