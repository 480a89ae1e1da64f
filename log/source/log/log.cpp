#include <log/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void Logger::setup(LoggerOptions const& options)
    {
        std::vector<spdlog::sink_ptr> sinks{};
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (options.file)
        {
            if (options.file->has_parent_path())
            {
                std::error_code ec;
                std::filesystem::create_directories(options.file->parent_path(), ec);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file->string(), options.maxFileSize, options.maxFiles));
        }

        auto logger = std::make_shared<spdlog::logger>("cloud-courier", sinks.begin(), sinks.end());
        logger->set_pattern(options.pattern);
        logger->set_level(toSpdlogLevel(options.level));
        spdlog::set_default_logger(logger);
        spdlog::set_level(toSpdlogLevel(options.level));

        std::scoped_lock lock{guard_};
        logger_ = std::move(logger);
    }

    void setup(LoggerOptions const& options)
    {
        Detail::logger.setup(options);
    }
}
