#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace Log
{
    struct LoggerOptions
    {
        Level level{Level::Info};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};
        std::optional<std::filesystem::path> file{std::nullopt};
        std::size_t maxFileSize{5 * 1024 * 1024};
        std::size_t maxFiles{3};
    };

    class Logger
    {
      public:
        Logger()
            : guard_{}
            , logger_{nullptr}
        {}

        /**
         * @brief Replaces the default spdlog logger with one that writes to stdout and, if configured, to a rotating
         * file.
         */
        void setup(LoggerOptions const& options);

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                logger_->set_level(toSpdlogLevel(level));
            spdlog::set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            return fromSpdlogLevel(spdlog::get_level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (toSpdlogLevel(level) < spdlog::get_level())
                return;

            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            std::shared_ptr<spdlog::logger> logger;
            {
                std::scoped_lock lock{guard_};
                logger = logger_;
            }
            if (logger)
                logger->log(toSpdlogLevel(level), msg);
            else
                spdlog::log(toSpdlogLevel(level), msg);
        }

      private:
        mutable std::mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
