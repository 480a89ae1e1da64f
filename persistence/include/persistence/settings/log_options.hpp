#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    struct LogOptions
    {
        std::optional<std::string> level{std::nullopt};
        std::optional<std::string> pattern{std::nullopt};
        std::optional<std::string> file{std::nullopt}; // No file sink when empty.

        void useDefaultsFrom(LogOptions const& other);
    };
    void to_json(nlohmann::json& j, LogOptions const& options);
    void from_json(nlohmann::json const& j, LogOptions& options);
}
