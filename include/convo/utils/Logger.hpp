#ifndef CONVO_UTILS_LOGGER_HPP
#define CONVO_UTILS_LOGGER_HPP

/**
 * @file Logger.hpp
 * @brief Process-wide logging facade over spdlog.
 *
 * Every component logs through the same singleton with a component prefix:
 *
 * @code{.cpp}
 * static convo::utils::Logger &logger = convo::utils::Logger::getInstance();
 * logger.log(Logger::Level::INFO, "[Delivery][Session] live on {}", conversationId);
 * @endcode
 */

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace convo::utils
{
    class Logger
    {
    public:
        enum class Level
        {
            TRACE,
            DEBUG,
            INFO,
            WARN,
            ERROR,
            CRITICAL,
            OFF
        };

        static Logger &getInstance();

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        template <typename... Args>
        void log(Level level, spdlog::format_string_t<Args...> fmt, Args &&...args)
        {
            logger_->log(to_spdlog(level), fmt, std::forward<Args>(args)...);
        }

        void setLevel(Level level);

        /// Accepts "trace", "debug", "info", "warn", "error", "critical", "off".
        /// Unknown names fall back to INFO.
        void setLevel(std::string_view name);

        [[nodiscard]] Level level() const;

        void setPattern(const std::string &pattern);

        [[nodiscard]] static Level parse_level(std::string_view name) noexcept;

    private:
        Logger();

        static spdlog::level::level_enum to_spdlog(Level level) noexcept;

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace convo::utils

#endif // CONVO_UTILS_LOGGER_HPP
