#include <persistence/settings/transfer_options.hpp>

#include <cstdint>
#include <string>

namespace Persistence
{
    void TransferOptions::useDefaultsFrom(TransferOptions const& other)
    {
        if (!concurrency)
            concurrency = other.concurrency;
        if (!pollInterval)
            pollInterval = other.pollInterval;
        if (!downloadDirectory)
            downloadDirectory = other.downloadDirectory;
    }
    void to_json(nlohmann::json& j, TransferOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.concurrency)
            j["concurrency"] = *options.concurrency;
        if (options.pollInterval)
            j["pollInterval"] = options.pollInterval->count();
        if (options.downloadDirectory)
            j["downloadDirectory"] = options.downloadDirectory->generic_string();
    }
    void from_json(nlohmann::json const& j, TransferOptions& options)
    {
        if (j.contains("concurrency"))
            options.concurrency = j["concurrency"].get<int>();
        if (j.contains("pollInterval"))
            options.pollInterval = std::chrono::milliseconds{j["pollInterval"].get<std::int64_t>()};
        if (j.contains("downloadDirectory"))
            options.downloadDirectory = std::filesystem::path{j["downloadDirectory"].get<std::string>()};
    }
}
