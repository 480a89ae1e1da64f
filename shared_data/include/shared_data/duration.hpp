#pragma once

#include <nlohmann/json.hpp>

#include <chrono>

namespace SharedData
{
    inline void to_json(nlohmann::json& j, std::chrono::milliseconds const& duration)
    {
        j = duration.count();
    }
    inline void from_json(nlohmann::json const& j, std::chrono::milliseconds& duration)
    {
        duration = std::chrono::milliseconds{j.get<std::chrono::milliseconds::rep>()};
    }
}

// Inject into STD for ADL:
namespace std::chrono
{
    inline void to_json(nlohmann::json& j, milliseconds const& duration)
    {
        SharedData::to_json(j, duration);
    }
    inline void from_json(nlohmann::json const& j, milliseconds& duration)
    {
        SharedData::from_json(j, duration);
    }
}
