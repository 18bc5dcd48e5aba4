// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "backends/SpdlogBackend.h"
#include "common/LogUtils.h"
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace FSE {

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    // Reuse the registered logger when a previous backend already created it
    logger_ = spdlog::get("FSE");

    if (!logger_) {
        if (logDir.empty() || !logToFile) {
            logger_ = spdlog::stdout_color_mt("FSE");
            logger_->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        } else {
            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console_sink);

            std::filesystem::create_directories(logDir);
            std::filesystem::path logPath = std::filesystem::path(logDir) / "fse.log";

            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);

            logger_ = std::make_shared<spdlog::logger>("FSE", sinks.begin(), sinks.end());
            spdlog::register_logger(logger_);
        }
    }

    logger_->set_level(convertLevel(Log::levelFromEnvironment().value_or(LogLevel::Info)));
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
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
    default:
        return spdlog::level::info;
    }
}

}  // namespace FSE
