#include <persistence/settings/settings.hpp>

namespace Persistence
{
    namespace
    {
        template <typename T>
        void mergeDefaults(std::optional<T>& target, std::optional<T> const& source)
        {
            if (!source)
                return;
            if (!target)
                target = source;
            else
                target->useDefaultsFrom(*source);
        }
    }

    Settings Settings::defaults()
    {
        using namespace std::chrono_literals;
        return Settings{
            .transfer =
                TransferOptions{
                    .concurrency = 3,
                    .pollInterval = 1000ms,
                    .downloadDirectory = std::filesystem::path{"downloads"},
                },
            .log =
                LogOptions{
                    .level = "info",
                    .pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v",
                    .file = "",
                },
            .shareLink =
                ShareLinkOptions{
                    .pattern = std::string{ShareLinkOptions::defaultPattern},
                },
            .actions =
                ActionOptions{
                    .moveSettleDelay = 2100ms,
                    .mkdirSettleDelay = 1500ms,
                    .recycleSettleDelay = 2600ms,
                },
            .update =
                UpdateOptions{
                    .currentVersion = "v0.0.0",
                },
        };
    }

    void Settings::useDefaultsFrom(Settings const& other)
    {
        mergeDefaults(transfer, other.transfer);
        mergeDefaults(log, other.log);
        mergeDefaults(shareLink, other.shareLink);
        mergeDefaults(actions, other.actions);
        mergeDefaults(update, other.update);
    }

    void to_json(nlohmann::json& j, Settings const& settings)
    {
        j = nlohmann::json::object();
        if (settings.transfer)
            j["transfer"] = *settings.transfer;
        if (settings.log)
            j["log"] = *settings.log;
        if (settings.shareLink)
            j["shareLink"] = *settings.shareLink;
        if (settings.actions)
            j["actions"] = *settings.actions;
        if (settings.update)
            j["update"] = *settings.update;
    }
    void from_json(nlohmann::json const& j, Settings& settings)
    {
        if (j.contains("transfer"))
            settings.transfer = j["transfer"].get<TransferOptions>();
        if (j.contains("log"))
            settings.log = j["log"].get<LogOptions>();
        if (j.contains("shareLink"))
            settings.shareLink = j["shareLink"].get<ShareLinkOptions>();
        if (j.contains("actions"))
            settings.actions = j["actions"].get<ActionOptions>();
        if (j.contains("update"))
            settings.update = j["update"].get<UpdateOptions>();
    }
}
