// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/ILoggerBackend.h"
#include <fmt/format.h>
#include <memory>
#include <source_location>
#include <string>

namespace FSE {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * All engine diagnostics (rejected configuration calls, unreachable state
 * changes, fired transitions) go through this facade. Two usage patterns:
 *
 * 1. Default mode: built-in backend (spdlog if available, DefaultBackend otherwise)
 * 2. Custom mode: the host injects its own ILoggerBackend implementation
 *
 * Example: Using default logger
 * @code
 * FSE::Logger::initialize();
 * LOG_INFO("Character {} ready", name);
 * @endcode
 *
 * Example: Injecting custom logger
 * @code
 * FSE::Logger::setBackend(std::make_unique<MyEngineLogger>());
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     *
     * Replaces the current backend with a user-provided implementation.
     *
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout, no file)
     *
     * Creates default backend if no custom backend was injected.
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    /**
     * @brief Set minimum log level
     *
     * @param level Minimum level to log
     */
    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    /**
     * @brief Flush log buffers
     */
    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace FSE

// fmt::format keeps the std::format call syntax on toolchains without <format>
#define LOG_TRACE(...) FSE::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) FSE::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) FSE::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) FSE::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) FSE::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
