#pragma once

#include <log/logger_backend.hpp>
#include <persistence/settings/log_options.hpp>

namespace Log
{
    /**
     * @brief Translates the log section of the settings. An empty file name disables the file sink.
     */
    LoggerOptions loggerOptions(Persistence::LogOptions const& options);

    /// Sets up the default logger from the settings.
    void configure(Persistence::LogOptions const& options);
}
