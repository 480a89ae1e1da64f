#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace Persistence
{
    struct ShareLinkOptions
    {
        static constexpr std::string_view defaultPattern =
            R"((https?://[-\w.]+/[A-Za-z0-9/]+)[^0-9a-z]*([a-z0-9]+)?)";

        /// Regular expression finding a share link (group 1) and an optional extraction code (group 2).
        std::optional<std::string> pattern{std::nullopt};

        void useDefaultsFrom(ShareLinkOptions const& other);
    };
    void to_json(nlohmann::json& j, ShareLinkOptions const& options);
    void from_json(nlohmann::json const& j, ShareLinkOptions& options);

    /**
     * @brief The remote needs some time until changes become visible in listings. These are the waits after a
     * successful change before listeners are told to refresh.
     */
    struct ActionOptions
    {
        std::optional<std::chrono::milliseconds> moveSettleDelay{std::nullopt};
        std::optional<std::chrono::milliseconds> mkdirSettleDelay{std::nullopt};
        std::optional<std::chrono::milliseconds> recycleSettleDelay{std::nullopt};

        void useDefaultsFrom(ActionOptions const& other);
    };
    void to_json(nlohmann::json& j, ActionOptions const& options);
    void from_json(nlohmann::json const& j, ActionOptions& options);

    struct UpdateOptions
    {
        std::optional<std::string> currentVersion{std::nullopt};

        void useDefaultsFrom(UpdateOptions const& other);
    };
    void to_json(nlohmann::json& j, UpdateOptions const& options);
    void from_json(nlohmann::json const& j, UpdateOptions& options);
}
