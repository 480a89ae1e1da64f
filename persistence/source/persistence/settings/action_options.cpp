#include <persistence/settings/action_options.hpp>

#include <cstdint>

namespace Persistence
{
    namespace
    {
        void readDelay(nlohmann::json const& j, char const* name, std::optional<std::chrono::milliseconds>& delay)
        {
            if (j.contains(name))
                delay = std::chrono::milliseconds{j[name].get<std::int64_t>()};
        }
        void writeDelay(nlohmann::json& j, char const* name, std::optional<std::chrono::milliseconds> const& delay)
        {
            if (delay)
                j[name] = delay->count();
        }
    }

    void ShareLinkOptions::useDefaultsFrom(ShareLinkOptions const& other)
    {
        if (!pattern)
            pattern = other.pattern;
    }
    void to_json(nlohmann::json& j, ShareLinkOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.pattern)
            j["pattern"] = *options.pattern;
    }
    void from_json(nlohmann::json const& j, ShareLinkOptions& options)
    {
        if (j.contains("pattern"))
            options.pattern = j["pattern"].get<std::string>();
    }

    void ActionOptions::useDefaultsFrom(ActionOptions const& other)
    {
        if (!moveSettleDelay)
            moveSettleDelay = other.moveSettleDelay;
        if (!mkdirSettleDelay)
            mkdirSettleDelay = other.mkdirSettleDelay;
        if (!recycleSettleDelay)
            recycleSettleDelay = other.recycleSettleDelay;
    }
    void to_json(nlohmann::json& j, ActionOptions const& options)
    {
        j = nlohmann::json::object();
        writeDelay(j, "moveSettleDelay", options.moveSettleDelay);
        writeDelay(j, "mkdirSettleDelay", options.mkdirSettleDelay);
        writeDelay(j, "recycleSettleDelay", options.recycleSettleDelay);
    }
    void from_json(nlohmann::json const& j, ActionOptions& options)
    {
        readDelay(j, "moveSettleDelay", options.moveSettleDelay);
        readDelay(j, "mkdirSettleDelay", options.mkdirSettleDelay);
        readDelay(j, "recycleSettleDelay", options.recycleSettleDelay);
    }

    void UpdateOptions::useDefaultsFrom(UpdateOptions const& other)
    {
        if (!currentVersion)
            currentVersion = other.currentVersion;
    }
    void to_json(nlohmann::json& j, UpdateOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.currentVersion)
            j["currentVersion"] = *options.currentVersion;
    }
    void from_json(nlohmann::json const& j, UpdateOptions& options)
    {
        if (j.contains("currentVersion"))
            options.currentVersion = j["currentVersion"].get<std::string>();
    }
}
