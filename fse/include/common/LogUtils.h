// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/ILoggerBackend.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace FSE {
namespace Log {

/**
 * @brief Parse a spdlog-style level name
 *
 * Accepts trace, debug, info, warn/warning, err/error, critical and off
 * (case-insensitive).
 *
 * @param name Level name
 * @return Parsed level, or std::nullopt for unknown names
 */
inline std::optional<LogLevel> parseLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") {
        return LogLevel::Trace;
    } else if (name == "debug") {
        return LogLevel::Debug;
    } else if (name == "info") {
        return LogLevel::Info;
    } else if (name == "warn" || name == "warning") {
        return LogLevel::Warn;
    } else if (name == "err" || name == "error") {
        return LogLevel::Error;
    } else if (name == "critical") {
        return LogLevel::Critical;
    } else if (name == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

/**
 * @brief Read the SPDLOG_LEVEL environment variable
 * @return Requested level, or std::nullopt when unset or unknown
 */
inline std::optional<LogLevel> levelFromEnvironment() {
    const char *envLevel = std::getenv("SPDLOG_LEVEL");
    if (!envLevel) {
        return std::nullopt;
    }
    return parseLevel(envLevel);
}

}  // namespace Log
}  // namespace FSE
