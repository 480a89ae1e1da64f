#include <backend/logging.hpp>
#include <log/log.hpp>

namespace Log
{
    LoggerOptions loggerOptions(Persistence::LogOptions const& options)
    {
        LoggerOptions result{};
        if (options.level)
        {
            if (const auto level = levelFromString(*options.level); level)
                result.level = *level;
            else
                warn("Unknown log level '{}', using {}.", *options.level, levelToString(result.level));
        }
        if (options.pattern && !options.pattern->empty())
            result.pattern = *options.pattern;
        if (options.file && !options.file->empty())
            result.file = std::filesystem::path{*options.file};
        return result;
    }

    void configure(Persistence::LogOptions const& options)
    {
        setup(loggerOptions(options));
    }
}
