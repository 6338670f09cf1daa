/************************************************************************\

    Passdeck - Password store browser
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "Logger.h"

#include <QDir>
#include <QString>

#include <iostream>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr char loggerName[] = "passdeck";
constexpr char logFileName[] = "passdeck.log";
constexpr std::size_t maxLogFileBytes = 1024 * 1024 * 5;
constexpr std::size_t maxLogFiles = 3;
}

/**
 * @brief Builds the application logger.
 *
 * Messages go to a colored stderr sink and, when logDir is not empty, to a
 * rotating file in that folder. Calling init again replaces the logger.
 *
 * @param logDir Folder for the rotating log file, empty for stderr only.
 * @param logLevel Minimum level that is emitted.
 */
void Logger::init(const std::string &logDir, spdlog::level::level_enum logLevel)
{
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(logLevel);
    sinks.push_back(consoleSink);

    if (!logDir.empty()) {
        const QString dirPath = QString::fromStdString(logDir);
        if (QDir().mkpath(dirPath)) {
            try {
                const std::string filePath = QDir(dirPath).filePath(QLatin1String(logFileName)).toStdString();
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    filePath, maxLogFileBytes, maxLogFiles);
                fileSink->set_level(logLevel);
                sinks.push_back(fileSink);
            } catch (const spdlog::spdlog_ex &e) {
                std::cerr << "[Logger] Failed to open log file: " << e.what() << std::endl;
            }
        } else {
            std::cerr << "[Logger] Cannot create log folder " << logDir << std::endl;
        }
    }

    spdlog::drop(loggerName);
    auto logger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
    logger->set_level(logLevel);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    coreLogger() = logger;
}

/**
 * @brief Returns the application logger, creating a stderr-only one on first use.
 */
std::shared_ptr<spdlog::logger> Logger::core()
{
    if (!coreLogger()) {
        init();
    }
    return coreLogger();
}

spdlog::level::level_enum Logger::levelFromName(const QString &name)
{
    const spdlog::level::level_enum level = spdlog::level::from_str(name.trimmed().toLower().toStdString());
    // from_str maps unknown names to off; keep logging on for typos.
    if (level == spdlog::level::off && name.trimmed().compare(QLatin1String("off"), Qt::CaseInsensitive) != 0) {
        return spdlog::level::info;
    }
    return level;
}

std::shared_ptr<spdlog::logger> &Logger::coreLogger()
{
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}
