#include <persistence/settings/log_options.hpp>

namespace Persistence
{
    void LogOptions::useDefaultsFrom(LogOptions const& other)
    {
        if (!level)
            level = other.level;
        if (!pattern)
            pattern = other.pattern;
        if (!file)
            file = other.file;
    }
    void to_json(nlohmann::json& j, LogOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.level)
            j["level"] = *options.level;
        if (options.pattern)
            j["pattern"] = *options.pattern;
        if (options.file)
            j["file"] = *options.file;
    }
    void from_json(nlohmann::json const& j, LogOptions& options)
    {
        if (j.contains("level"))
            options.level = j["level"].get<std::string>();
        if (j.contains("pattern"))
            options.pattern = j["pattern"].get<std::string>();
        if (j.contains("file"))
            options.file = j["file"].get<std::string>();
    }
}
