#pragma once

#include <spdlog/spdlog.h>

#include <utility/algorithm/case_convert.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Off
    };

    namespace Detail
    {
        struct LevelMapping
        {
            Level level;
            spdlog::level::level_enum spdlogLevel;
            std::string_view name;
        };

        inline constexpr std::array<LevelMapping, 7> levelMappings{{
            {Level::Trace, spdlog::level::trace, "trace"},
            {Level::Debug, spdlog::level::debug, "debug"},
            {Level::Info, spdlog::level::info, "info"},
            {Level::Warning, spdlog::level::warn, "warning"},
            {Level::Error, spdlog::level::err, "error"},
            {Level::Critical, spdlog::level::critical, "critical"},
            {Level::Off, spdlog::level::off, "off"},
        }};
    }

    inline spdlog::level::level_enum toSpdlogLevel(Level lvl)
    {
        for (auto const& mapping : Detail::levelMappings)
            if (mapping.level == lvl)
                return mapping.spdlogLevel;
        return spdlog::level::info;
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum lvl)
    {
        for (auto const& mapping : Detail::levelMappings)
            if (mapping.spdlogLevel == lvl)
                return mapping.level;
        return Level::Info;
    }

    /**
     * @brief Parses a level name, case insensitive. "warn" is accepted for warning.
     *
     * @return The level or nullopt for unknown names.
     */
    inline std::optional<Level> levelFromString(std::string_view str)
    {
        const auto lowered = Utility::Algorithm::toLowerCase(Utility::Algorithm::trim(std::string{str}));
        if (lowered == "warn")
            return Level::Warning;
        for (auto const& mapping : Detail::levelMappings)
            if (mapping.name == lowered)
                return mapping.level;
        return std::nullopt;
    }

    inline std::string levelToString(Level lvl)
    {
        for (auto const& mapping : Detail::levelMappings)
            if (mapping.level == lvl)
                return std::string{mapping.name};
        return "info";
    }
}
