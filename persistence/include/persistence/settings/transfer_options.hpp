#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>

namespace Persistence
{
    struct TransferOptions
    {
        std::optional<int> concurrency{std::nullopt}; // How many downloads may run in parallel?
        std::optional<std::chrono::milliseconds> pollInterval{std::nullopt};
        std::optional<std::filesystem::path> downloadDirectory{std::nullopt};

        void useDefaultsFrom(TransferOptions const& other);
    };
    void to_json(nlohmann::json& j, TransferOptions const& options);
    void from_json(nlohmann::json const& j, TransferOptions& options);
}
