#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

class QString;

class Logger
{
public:
    static void init(const std::string &logDir = std::string(),
                     spdlog::level::level_enum logLevel = spdlog::level::info);

    static std::shared_ptr<spdlog::logger> core();
    static spdlog::level::level_enum levelFromName(const QString &name);

private:
    static std::shared_ptr<spdlog::logger> &coreLogger();
};
