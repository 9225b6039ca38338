#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    static void init(const std::string &log_level = "INFO")
    {
        auto logger = getLogger();
        logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");

        spdlog::level::level_enum level;
        if (!parseLevel(log_level, level))
        {
            logger->set_level(spdlog::level::info);
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
            return;
        }

        logger->set_level(level);
    }

    static void setLevel(const std::string &log_level)
    {
        init(log_level);
        debug("Log level changed to: " + log_level);
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stdout_color_mt("snippet_batch");
        return logger;
    }

    static bool parseLevel(std::string log_level, spdlog::level::level_enum &level)
    {
        std::transform(log_level.begin(), log_level.end(), log_level.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });

        if (log_level == "TRACE")
            level = spdlog::level::trace;
        else if (log_level == "DEBUG")
            level = spdlog::level::debug;
        else if (log_level == "INFO")
            level = spdlog::level::info;
        else if (log_level == "WARN" || log_level == "WARNING")
            level = spdlog::level::warn;
        else if (log_level == "ERROR")
            level = spdlog::level::err;
        else
            return false;
        return true;
    }

    static void log(Level level, const std::string &message)
    {
        auto logger = getLogger();
        switch (level)
        {
        case Level::TRACE:
            logger->trace(message);
            break;
        case Level::DEBUG:
            logger->debug(message);
            break;
        case Level::INFO:
            logger->info(message);
            break;
        case Level::WARN:
            logger->warn(message);
            break;
        case Level::ERROR:
            logger->error(message);
            break;
        }
    }
};
