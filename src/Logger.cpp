#include <convo/utils/Logger.hpp>

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace convo::utils
{
    Logger &Logger::getInstance()
    {
        static Logger instance;
        return instance;
    }

    Logger::Logger()
        : logger_(spdlog::get("convo"))
    {
        if (!logger_)
        {
            logger_ = spdlog::stdout_color_mt("convo");
        }
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v");
        logger_->set_level(spdlog::level::info);
    }

    void Logger::setLevel(Level level)
    {
        logger_->set_level(to_spdlog(level));
    }

    void Logger::setLevel(std::string_view name)
    {
        setLevel(parse_level(name));
    }

    Logger::Level Logger::level() const
    {
        switch (logger_->level())
        {
        case spdlog::level::trace:
            return Level::TRACE;
        case spdlog::level::debug:
            return Level::DEBUG;
        case spdlog::level::info:
            return Level::INFO;
        case spdlog::level::warn:
            return Level::WARN;
        case spdlog::level::err:
            return Level::ERROR;
        case spdlog::level::critical:
            return Level::CRITICAL;
        default:
            return Level::OFF;
        }
    }

    void Logger::setPattern(const std::string &pattern)
    {
        logger_->set_pattern(pattern);
    }

    Logger::Level Logger::parse_level(std::string_view name) noexcept
    {
        auto is = [name](std::string_view candidate)
        {
            return name.size() == candidate.size() &&
                   std::equal(name.begin(), name.end(), candidate.begin(),
                              [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) == b; });
        };

        if (is("trace"))
            return Level::TRACE;
        if (is("debug"))
            return Level::DEBUG;
        if (is("warn") || is("warning"))
            return Level::WARN;
        if (is("error"))
            return Level::ERROR;
        if (is("critical"))
            return Level::CRITICAL;
        if (is("off"))
            return Level::OFF;
        return Level::INFO;
    }

    spdlog::level::level_enum Logger::to_spdlog(Level level) noexcept
    {
        switch (level)
        {
        case Level::TRACE:
            return spdlog::level::trace;
        case Level::DEBUG:
            return spdlog::level::debug;
        case Level::INFO:
            return spdlog::level::info;
        case Level::WARN:
            return spdlog::level::warn;
        case Level::ERROR:
            return spdlog::level::err;
        case Level::CRITICAL:
            return spdlog::level::critical;
        case Level::OFF:
        default:
            return spdlog::level::off;
        }
    }

} // namespace convo::utils
