#pragma once

#include <persistence/settings/action_options.hpp>
#include <persistence/settings/log_options.hpp>
#include <persistence/settings/transfer_options.hpp>

#include <nlohmann/json.hpp>

#include <optional>

namespace Persistence
{
    /**
     * @brief Everything read from the settings file. Every part may be missing in the file,
     * useDefaultsFrom(Settings::defaults()) completes it.
     */
    struct Settings
    {
        std::optional<TransferOptions> transfer{std::nullopt};
        std::optional<LogOptions> log{std::nullopt};
        std::optional<ShareLinkOptions> shareLink{std::nullopt};
        std::optional<ActionOptions> actions{std::nullopt};
        std::optional<UpdateOptions> update{std::nullopt};

        void useDefaultsFrom(Settings const& other);

        /// A fully populated instance.
        static Settings defaults();
    };
    void to_json(nlohmann::json& j, Settings const& settings);
    void from_json(nlohmann::json const& j, Settings& settings);
}
