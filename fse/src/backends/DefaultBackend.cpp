// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "backends/DefaultBackend.h"
#include "common/LogUtils.h"
#include <ctime>
#include <fmt/format.h>

namespace FSE {

namespace Colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *TRACE = "\033[37m";
constexpr const char *DEBUG = "\033[36m";
constexpr const char *INFO = "\033[32m";
constexpr const char *WARN = "\033[33m";
constexpr const char *ERROR = "\033[31m";
constexpr const char *CRITICAL = "\033[35m";
}  // namespace Colors

DefaultBackend::DefaultBackend() : currentLevel_(Log::levelFromEnvironment().value_or(LogLevel::Info)) {}

void DefaultBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    if (level < currentLevel_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::cout << "[" << getTimestamp() << "] "
              << "[" << levelToColor(level) << levelToString(level) << Colors::RESET << "] " << message << "\n";
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
}

const char *DefaultBackend::levelToString(LogLevel level) {
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
    default:
        return "unknown";
    }
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
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_time_t);
#else
    localtime_r(&now_time_t, &tm_buf);
#endif

    return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(now_ms.count()));
}

}  // namespace FSE
